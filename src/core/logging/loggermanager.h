#pragma once

#ifndef LOGGING_LOGGERMANAGER_H
#define LOGGING_LOGGERMANAGER_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "logger.h"

namespace tracerr::core::logging {

/**
 * @brief Central registry of named loggers
 *
 * New loggers receive every global sink and the level configured for their
 * name, or for the closest dotted parent ("tracerr" configures
 * "tracerr.error"), falling back to the default level.
 */
class LoggerManager {
public:
    using LoggerPtr = std::shared_ptr<Logger>;
    using SinkPtr = std::shared_ptr<LogSink>;

    static LoggerManager& instance() {
        static LoggerManager manager;
        return manager;
    }

    LoggerManager(const LoggerManager&) = delete;
    LoggerManager& operator=(const LoggerManager&) = delete;

    /**
     * @brief Get or create a logger with the given name
     */
    LoggerPtr get_logger(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second;
        }

        auto logger = std::make_shared<Logger>(name);
        logger->set_level(configured_level(name));
        for (const auto& sink : global_sinks_) {
            logger->add_sink(sink);
        }

        loggers_.emplace(name, logger);
        return logger;
    }

    LoggerPtr get_root_logger() {
        return get_logger("root");
    }

    /**
     * @brief Set level for a logger and optionally its children
     */
    void set_level(const std::string& name, LogLevel level, bool include_children = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        levels_[name] = level;

        for (auto& [logger_name, logger] : loggers_) {
            if (logger_name == name ||
                (include_children && is_child_logger(logger_name, name))) {
                logger->set_level(level);
            }
        }
    }

    void set_default_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_level_ = level;
    }

    /**
     * @brief Add a sink to all current and future loggers
     */
    void add_global_sink(SinkPtr sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        global_sinks_.push_back(sink);
        for (auto& [name, logger] : loggers_) {
            logger->add_sink(sink);
        }
    }

    void remove_global_sink(const SinkPtr& sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        global_sinks_.erase(std::remove(global_sinks_.begin(), global_sinks_.end(), sink),
                            global_sinks_.end());
        for (auto& [name, logger] : loggers_) {
            logger->remove_sink(sink);
        }
    }

    [[nodiscard]] std::vector<std::string> get_logger_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(loggers_.size());
        for (const auto& [name, logger] : loggers_) {
            names.push_back(name);
        }
        return names;
    }

    void flush_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, logger] : loggers_) {
            logger->flush();
        }
    }

private:
    LoggerManager() {
        auto console = std::make_shared<ConsoleSink>();
        console->set_level(LogLevelConfig::DEFAULT_CONSOLE_LEVEL);
        global_sinks_.push_back(std::move(console));
    }

    LogLevel configured_level(const std::string& name) const {
        std::string current = name;
        while (true) {
            if (auto it = levels_.find(current); it != levels_.end()) {
                return it->second;
            }
            auto dot = current.rfind('.');
            if (dot == std::string::npos) {
                return default_level_;
            }
            current.erase(dot);
        }
    }

    static bool is_child_logger(const std::string& child, const std::string& parent) {
        return child.size() > parent.size() &&
               child.compare(0, parent.size(), parent) == 0 &&
               child[parent.size()] == '.';
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, LoggerPtr> loggers_;
    std::unordered_map<std::string, LogLevel> levels_;
    std::vector<SinkPtr> global_sinks_;
    LogLevel default_level_ = LogLevelConfig::DEFAULT_LEVEL;
};

/**
 * @brief Get a logger by name
 */
inline std::shared_ptr<Logger> get_logger(const std::string& name) {
    return LoggerManager::instance().get_logger(name);
}

inline std::shared_ptr<Logger> get_root_logger() {
    return LoggerManager::instance().get_root_logger();
}

} // namespace tracerr::core::logging

#endif // LOGGING_LOGGERMANAGER_H
