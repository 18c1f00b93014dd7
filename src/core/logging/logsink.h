#pragma once

#ifndef LOGGING_LOGSINK_H
#define LOGGING_LOGSINK_H

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "logmessage.h"
#include "logformatter.h"

namespace tracerr::core::logging {

/**
 * @brief Abstract base class for log output destinations
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    /**
     * @brief Write a log message to the sink
     */
    virtual void write(const LogMessage& message) = 0;

    /**
     * @brief Flush any buffered data
     */
    virtual void flush() = 0;

    void set_formatter(std::unique_ptr<LogFormatter> formatter) {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        formatter_ = std::move(formatter);
    }

    /**
     * @brief Format with the configured formatter (basic one if none set)
     */
    std::string format(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        if (!formatter_) {
            formatter_ = std::make_unique<BasicLogFormatter>();
        }
        return formatter_->format(message);
    }

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel get_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    void set_enabled(bool enabled) {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled() const {
        return enabled_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(const LogMessage& message) const {
        return is_enabled() && logging::is_enabled(message.get_level(), get_level());
    }

private:
    std::atomic<LogLevel> min_level_{LogLevel::TRACE};
    std::atomic<bool> enabled_{true};
    std::unique_ptr<LogFormatter> formatter_;
    std::mutex formatter_mutex_;
};

/**
 * @brief Console sink for stdout/stderr output
 */
class ConsoleSink : public LogSink {
public:
    enum class OutputMode {
        STDOUT_ONLY,
        STDERR_ONLY,
        SPLIT_BY_LEVEL
    };

    explicit ConsoleSink(OutputMode mode = OutputMode::STDERR_ONLY,
                         bool use_color = true)
        : mode_(mode)
        , use_color_(use_color) {}

    ConsoleSink(const ConsoleSink&) = delete;
    ConsoleSink& operator=(const ConsoleSink&) = delete;

    void write(const LogMessage& message) override {
        if (!should_log(message)) return;

        std::string formatted = format(message);

        std::ostream* out = &std::cerr;
        int fd = STDERR_FILENO;
        switch (mode_) {
            case OutputMode::STDOUT_ONLY:
                out = &std::cout;
                fd = STDOUT_FILENO;
                break;
            case OutputMode::STDERR_ONLY:
                break;
            case OutputMode::SPLIT_BY_LEVEL:
                if (message.get_level() < LogLevel::WARN) {
                    out = &std::cout;
                    fd = STDOUT_FILENO;
                }
                break;
        }

        if (use_color_ && ::isatty(fd)) {
            formatted = std::string(get_color_code(message.get_level())) +
                        formatted + std::string(COLOR_RESET);
        }

        std::lock_guard<std::mutex> lock(output_mutex_);
        *out << formatted << '\n';
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

    void set_color_enabled(bool enabled) { use_color_ = enabled; }
    [[nodiscard]] bool is_color_enabled() const { return use_color_; }

private:
    OutputMode mode_;
    bool use_color_;
    std::mutex output_mutex_;
};

/**
 * @brief Memory buffer sink for capturing logs in memory
 */
class MemorySink : public LogSink {
public:
    explicit MemorySink(size_t max_messages = 10000)
        : max_messages_(max_messages) {}

    void write(const LogMessage& message) override {
        if (!should_log(message)) return;

        std::string formatted = format(message);

        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (max_messages_ == 0) return;
        if (messages_.size() >= max_messages_) {
            messages_.erase(messages_.begin());
        }
        messages_.push_back(message);
        formatted_buffer_ << formatted << '\n';
    }

    void flush() override {}

    [[nodiscard]] std::vector<LogMessage> get_messages() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return messages_;
    }

    [[nodiscard]] std::string get_formatted_content() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return formatted_buffer_.str();
    }

    /**
     * @brief Check whether any stored message contains the given text
     */
    [[nodiscard]] bool contains(const std::string& text) const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        for (const auto& message : messages_) {
            if (message.get_message().find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        messages_.clear();
        formatted_buffer_.str("");
        formatted_buffer_.clear();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return messages_.size();
    }

private:
    size_t max_messages_;
    mutable std::mutex buffer_mutex_;
    std::vector<LogMessage> messages_;
    std::ostringstream formatted_buffer_;
};

/**
 * @brief Sink that discards everything
 */
class NullSink : public LogSink {
public:
    void write(const LogMessage&) override {}
    void flush() override {}
};

} // namespace tracerr::core::logging

#endif // LOGGING_LOGSINK_H
