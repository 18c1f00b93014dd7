#pragma once

#ifndef CORE_ERROR_ERROR_H
#define CORE_ERROR_ERROR_H

#include <cstdarg>
#include <memory>
#include <string>
#include <vector>

#include "../config/config.h"

namespace tracerr::core::error {

class Error;
class StackTrace;

/**
 * @brief Shared handle to an immutable error value
 *
 * A null ErrorPtr means "no error". Identity comparisons use the pointer.
 */
using ErrorPtr = std::shared_ptr<const Error>;

/**
 * @brief Base class of all error values
 *
 * Errors are immutable once built. unwrap() exposes at most one wrapped
 * error; chains are walked by calling it repeatedly.
 */
class Error {
public:
    virtual ~Error() = default;

    /**
     * @brief Human readable message
     */
    virtual std::string message() const = 0;

    /**
     * @brief The error this one wraps, or null
     */
    virtual ErrorPtr unwrap() const { return nullptr; }
};

/**
 * @brief Capability of errors that carry a captured call stack
 *
 * Wrap logic checks for this interface instead of concrete error types, so
 * other error classes can take part in trace propagation.
 */
class HasStackTrace {
public:
    virtual ~HasStackTrace() = default;

    virtual const StackTrace& stack_trace() const = 0;
};

/**
 * @brief Plain error holding only a message
 */
class SimpleError : public Error {
public:
    explicit SimpleError(std::string message)
        : message_(std::move(message)) {}

    std::string message() const override { return message_; }

private:
    std::string message_;
};

/**
 * @brief Error that adds a message on top of a cause
 */
class WrappedError : public Error {
public:
    WrappedError(std::string message, ErrorPtr cause)
        : message_(std::move(message))
        , cause_(std::move(cause)) {}

    std::string message() const override { return message_; }
    ErrorPtr unwrap() const override { return cause_; }

private:
    std::string message_;
    ErrorPtr cause_;
};

// ==============================================================================
// Factories
// ==============================================================================

ErrorPtr make_error(std::string message);

/**
 * @brief Wrap a cause under a context message "<context>: <cause>"
 *
 * A null cause yields a plain error with the context as message.
 */
ErrorPtr make_wrapped(const std::string& context, ErrorPtr cause);

// ==============================================================================
// Chain inspection
// ==============================================================================

/**
 * @brief True if target appears (by identity) anywhere in err's chain
 */
bool is(const ErrorPtr& err, const ErrorPtr& target);

/**
 * @brief Deepest error in the unwrap chain, null for null input
 */
ErrorPtr root_cause(const ErrorPtr& err);

/**
 * @brief Messages of the chain, outermost first
 */
std::vector<std::string> extract_chain(const ErrorPtr& err);

std::string format_chain(const ErrorPtr& err,
                         const std::string& separator = "\n  Caused by: ");

/**
 * @brief Message of err, empty string for null
 */
std::string message_of(const ErrorPtr& err);

// ==============================================================================
// printf-style formatting
// ==============================================================================

std::string format_message(const char* format, ...) CORE_PRINTF_FORMAT(1, 2);
std::string vformat_message(const char* format, std::va_list args);

} // namespace tracerr::core::error

#endif // CORE_ERROR_ERROR_H
