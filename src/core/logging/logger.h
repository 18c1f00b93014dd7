#pragma once

#ifndef LOGGING_LOGGER_H
#define LOGGING_LOGGER_H

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <vector>

#include "../config/config.h"
#include "loglevel.h"
#include "logmessage.h"
#include "logsink.h"

namespace tracerr::core::logging {

/**
 * @brief Concatenate streamable arguments into one message
 */
template<typename... Args>
std::string concat(const Args&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

/**
 * @brief Named logger dispatching to a set of sinks
 */
class Logger {
public:
    explicit Logger(std::string name)
        : logger_name_(std::move(name))
        , level_(LogLevelConfig::DEFAULT_LEVEL)
        , enabled_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger() {
        flush();
    }

    void trace(const std::string& message,
               std::source_location loc = std::source_location::current()) {
        log(LogLevel::TRACE, message, loc);
    }

    void debug(const std::string& message,
               std::source_location loc = std::source_location::current()) {
        log(LogLevel::DEBUG, message, loc);
    }

    void info(const std::string& message,
              std::source_location loc = std::source_location::current()) {
        log(LogLevel::INFO, message, loc);
    }

    void warn(const std::string& message,
              std::source_location loc = std::source_location::current()) {
        log(LogLevel::WARN, message, loc);
    }

    void error(const std::string& message,
               std::source_location loc = std::source_location::current()) {
        log(LogLevel::ERROR, message, loc);
    }

    void fatal(const std::string& message,
               std::source_location loc = std::source_location::current()) {
        log(LogLevel::FATAL, message, loc);
    }

    void log(LogLevel level, const std::string& message,
             std::source_location loc = std::source_location::current()) {
        if (!should_log(level)) return;

        LogMessage msg(level, logger_name_, message, loc);
        msg.set_sequence_number(next_sequence_number_++);
        write_to_sinks(msg);
    }

    void set_level(LogLevel level) {
        level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel get_level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_enabled(bool enabled) {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled() const {
        return enabled_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& name() const { return logger_name_; }

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
            sinks_.push_back(std::move(sink));
        }
    }

    void remove_sink(const std::shared_ptr<LogSink>& sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.clear();
    }

    [[nodiscard]] size_t sink_count() const {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        return sinks_.size();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

    [[nodiscard]] bool should_log(LogLevel level) const {
        return is_enabled() && logging::is_enabled(level, get_level());
    }

    [[nodiscard]] bool is_trace_enabled() const { return should_log(LogLevel::TRACE); }
    [[nodiscard]] bool is_debug_enabled() const { return should_log(LogLevel::DEBUG); }

private:
    void write_to_sinks(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            if (sink->should_log(message)) {
                sink->write(message);
            }
        }
    }

    std::string logger_name_;
    std::atomic<LogLevel> level_;
    std::atomic<bool> enabled_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::atomic<std::uint64_t> next_sequence_number_{1};
};

// The message is only built when the level is enabled
#if CORE_ENABLE_LOGGING
#define TRACERR_LOG(logger, level, ...) \
    do { \
        if ((logger)->should_log(level)) { \
            (logger)->log(level, ::tracerr::core::logging::concat(__VA_ARGS__), \
                          std::source_location::current()); \
        } \
    } while (0)
#else
#define TRACERR_LOG(logger, level, ...) do { } while (0)
#endif

#define TRACERR_LOG_TRACE(logger, ...) TRACERR_LOG(logger, ::tracerr::core::logging::LogLevel::TRACE, __VA_ARGS__)
#define TRACERR_LOG_DEBUG(logger, ...) TRACERR_LOG(logger, ::tracerr::core::logging::LogLevel::DEBUG, __VA_ARGS__)
#define TRACERR_LOG_INFO(logger, ...)  TRACERR_LOG(logger, ::tracerr::core::logging::LogLevel::INFO, __VA_ARGS__)
#define TRACERR_LOG_WARN(logger, ...)  TRACERR_LOG(logger, ::tracerr::core::logging::LogLevel::WARN, __VA_ARGS__)
#define TRACERR_LOG_ERROR(logger, ...) TRACERR_LOG(logger, ::tracerr::core::logging::LogLevel::ERROR, __VA_ARGS__)

} // namespace tracerr::core::logging

#endif // LOGGING_LOGGER_H
