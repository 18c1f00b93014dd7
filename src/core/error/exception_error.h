#pragma once

#ifndef CORE_ERROR_EXCEPTION_ERROR_H
#define CORE_ERROR_EXCEPTION_ERROR_H

#include <exception>
#include <stdexcept>
#include <string>

#include "error.h"

namespace tracerr::core::error {

/**
 * @brief Exception carrying an error value across a throw
 */
class TracedException : public std::runtime_error {
public:
    explicit TracedException(ErrorPtr err)
        : std::runtime_error(message_of(err))
        , error_(std::move(err)) {}

    const ErrorPtr& error() const noexcept { return error_; }

private:
    ErrorPtr error_;
};

/**
 * @brief Throw err as a TracedException
 * @throws std::invalid_argument if err is null
 */
[[noreturn]] void raise(const ErrorPtr& err);

/**
 * @brief Error view of a caught exception
 *
 * message() is what() of the exception. When the exception was thrown with
 * std::throw_with_nested, unwrap() yields the nested exception converted
 * through from_exception(), so a nested TracedException contributes its
 * original error (and its trace) to the chain.
 */
class ExceptionError : public Error {
public:
    explicit ExceptionError(std::exception_ptr exception);

    std::string message() const override { return message_; }
    ErrorPtr unwrap() const override { return nested_; }

    const std::exception_ptr& exception() const noexcept { return exception_; }

    /**
     * @brief Throw the adapted exception again
     */
    [[noreturn]] void rethrow() const;

private:
    std::exception_ptr exception_;
    std::string message_;
    ErrorPtr nested_;
};

/**
 * @brief Convert an exception to an error value
 *
 * Null for a null pointer, the carried error for a TracedException, an
 * ExceptionError otherwise.
 */
ErrorPtr from_exception(const std::exception_ptr& exception);

/**
 * @brief from_exception(std::current_exception()), for use in catch blocks
 */
ErrorPtr from_current_exception();

} // namespace tracerr::core::error

#endif // CORE_ERROR_EXCEPTION_ERROR_H
