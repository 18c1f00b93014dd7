#pragma once

#ifndef LOGGING_LOGLEVEL_H
#define LOGGING_LOGLEVEL_H

#include <string>
#include <string_view>
#include <ostream>
#include <stdexcept>

namespace tracerr::core::logging {

/**
 * @brief Logging severity levels
 *
 * Higher values indicate more severe conditions:
 * - TRACE: Capture and propagation decisions of the tracer
 * - DEBUG: Recoverable oddities (unreadable source files, empty captures)
 * - INFO: General informational messages
 * - WARN: Warning conditions that might need attention
 * - ERROR: Error conditions that need handling
 * - FATAL: Critical errors
 * - OFF: Disable all logging
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

/**
 * @brief Convert LogLevel to string representation
 */
constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default:              return "UNKNOWN";
    }
}

/**
 * @brief Convert LogLevel to a single character
 */
constexpr char to_short_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return 'T';
        case LogLevel::DEBUG: return 'D';
        case LogLevel::INFO:  return 'I';
        case LogLevel::WARN:  return 'W';
        case LogLevel::ERROR: return 'E';
        case LogLevel::FATAL: return 'F';
        case LogLevel::OFF:   return 'O';
        default:              return '?';
    }
}

/**
 * @brief Convert string to LogLevel
 * @throws std::invalid_argument for unknown names
 */
inline LogLevel from_string(std::string_view str) {
    if (str == "TRACE" || str == "trace") return LogLevel::TRACE;
    if (str == "DEBUG" || str == "debug") return LogLevel::DEBUG;
    if (str == "INFO"  || str == "info")  return LogLevel::INFO;
    if (str == "WARN"  || str == "warn")  return LogLevel::WARN;
    if (str == "ERROR" || str == "error") return LogLevel::ERROR;
    if (str == "FATAL" || str == "fatal") return LogLevel::FATAL;
    if (str == "OFF"   || str == "off")   return LogLevel::OFF;

    throw std::invalid_argument("Invalid log level: " + std::string(str));
}

/**
 * @brief Terminal color for a level
 */
constexpr std::string_view get_color_code(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";     // White
        case LogLevel::DEBUG: return "\033[36m";     // Cyan
        case LogLevel::INFO:  return "\033[32m";     // Green
        case LogLevel::WARN:  return "\033[33m";     // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::FATAL: return "\033[35;1m";   // Bold Magenta
        default:              return "\033[0m";      // Reset
    }
}

constexpr std::string_view COLOR_RESET = "\033[0m";

/**
 * @brief Check if a message level passes a threshold
 */
constexpr bool is_enabled(LogLevel message_level, LogLevel threshold) noexcept {
    return message_level != LogLevel::OFF &&
           static_cast<int>(message_level) >= static_cast<int>(threshold);
}

inline std::ostream& operator<<(std::ostream& os, LogLevel level) {
    return os << to_string(level);
}

struct LogLevelConfig {
    static constexpr LogLevel DEFAULT_LEVEL = LogLevel::INFO;
    static constexpr LogLevel DEFAULT_CONSOLE_LEVEL = LogLevel::INFO;
};

} // namespace tracerr::core::logging

#endif // LOGGING_LOGLEVEL_H
