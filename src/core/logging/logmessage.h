#pragma once

#ifndef LOGGING_LOGMESSAGE_H
#define LOGGING_LOGMESSAGE_H

#include <string>
#include <chrono>
#include <thread>
#include <cstdint>
#include <source_location>

#include "loglevel.h"

namespace tracerr::core::logging {

/**
 * @brief One log entry, as handed to sinks
 */
class LogMessage {
public:
    using time_point = std::chrono::system_clock::time_point;

    LogMessage(LogLevel level, std::string logger_name, std::string message,
               const std::source_location& loc = std::source_location::current())
        : level_(level)
        , logger_name_(std::move(logger_name))
        , message_(std::move(message))
        , timestamp_(std::chrono::system_clock::now())
        , thread_id_(std::this_thread::get_id())
        , file_name_(loc.file_name())
        , function_name_(loc.function_name())
        , line_(loc.line()) {}

    LogLevel get_level() const { return level_; }
    const std::string& get_logger_name() const { return logger_name_; }
    const std::string& get_message() const { return message_; }
    const time_point& get_timestamp() const { return timestamp_; }
    std::thread::id get_thread_id() const { return thread_id_; }
    const char* get_file_name() const { return file_name_; }
    const char* get_function_name() const { return function_name_; }
    std::uint_least32_t get_line() const { return line_; }
    std::uint64_t get_sequence_number() const { return sequence_number_; }

    void set_sequence_number(std::uint64_t seq) { sequence_number_ = seq; }

private:
    LogLevel level_;
    std::string logger_name_;
    std::string message_;
    time_point timestamp_;
    std::thread::id thread_id_;
    const char* file_name_;
    const char* function_name_;
    std::uint_least32_t line_;
    std::uint64_t sequence_number_ = 0;
};

} // namespace tracerr::core::logging

#endif // LOGGING_LOGMESSAGE_H
