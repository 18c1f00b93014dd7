#pragma once

#ifndef LOGGING_LOGFORMATTER_H
#define LOGGING_LOGFORMATTER_H

#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "logmessage.h"

namespace tracerr::core::logging {

/**
 * @brief Converts log messages to text for a sink
 */
class LogFormatter {
public:
    virtual ~LogFormatter() = default;

    [[nodiscard]] virtual std::string format(const LogMessage& message) const = 0;

    [[nodiscard]] virtual std::unique_ptr<LogFormatter> clone() const = 0;
};

/**
 * @brief Basic formatter
 *
 * Format: [TIMESTAMP] [LEVEL] [LOGGER] MESSAGE
 */
class BasicLogFormatter : public LogFormatter {
public:
    struct Options {
        bool include_timestamp = true;
        bool include_level = true;
        bool include_logger_name = true;
        bool include_thread_id = false;
        bool include_location = false;
        bool use_short_level = false;
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
    };

    BasicLogFormatter() = default;
    explicit BasicLogFormatter(Options options)
        : options_(std::move(options)) {}

    [[nodiscard]] std::string format(const LogMessage& message) const override {
        std::ostringstream oss;

        if (options_.include_timestamp) {
            oss << '[' << format_timestamp(message.get_timestamp()) << "] ";
        }

        if (options_.include_level) {
            oss << '[';
            if (options_.use_short_level) {
                oss << to_short_string(message.get_level());
            } else {
                oss << std::left << std::setw(5) << to_string(message.get_level());
            }
            oss << "] ";
        }

        if (options_.include_logger_name && !message.get_logger_name().empty()) {
            oss << '[' << message.get_logger_name() << "] ";
        }

        if (options_.include_thread_id) {
            oss << "[T:" << message.get_thread_id() << "] ";
        }

        if (options_.include_location) {
            oss << '[' << extract_filename(message.get_file_name())
                << ':' << message.get_line() << "] ";
        }

        oss << message.get_message();
        return oss.str();
    }

    [[nodiscard]] std::unique_ptr<LogFormatter> clone() const override {
        return std::make_unique<BasicLogFormatter>(options_);
    }

    const Options& options() const { return options_; }

private:
    Options options_;

    [[nodiscard]] std::string format_timestamp(const LogMessage::time_point& tp) const {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};

#ifdef _WIN32
        localtime_s(&tm, &time_t);
#else
        localtime_r(&time_t, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, options_.timestamp_format.c_str());
        return oss.str();
    }

    static std::string_view extract_filename(std::string_view path) {
        auto pos = path.find_last_of("/\\");
        return pos == std::string_view::npos ? path : path.substr(pos + 1);
    }
};

} // namespace tracerr::core::logging

#endif // LOGGING_LOGFORMATTER_H
