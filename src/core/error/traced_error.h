#pragma once

#ifndef CORE_ERROR_TRACED_ERROR_H
#define CORE_ERROR_TRACED_ERROR_H

#include <memory>
#include <string>

#include "../config/config.h"
#include "../config/capture_config.h"
#include "error.h"
#include "stack_trace.h"

namespace tracerr::core::logging {
class Logger;
}

namespace tracerr::core::error {

/**
 * @brief Error paired with the call stack of its origin
 *
 * Both the underlying error and the frames are fixed at construction, so a
 * TracedError can be shared freely between threads.
 */
class TracedError : public Error, public HasStackTrace {
public:
    TracedError(ErrorPtr err, StackTrace frames)
        : err_(std::move(err))
        , frames_(std::move(frames)) {}

    std::string message() const override { return err_ ? err_->message() : std::string(); }

    /**
     * @brief The original error
     */
    ErrorPtr unwrap() const override { return err_; }

    const StackTrace& stack_trace() const override { return frames_; }

private:
    ErrorPtr err_;
    StackTrace frames_;
};

// ==============================================================================
// Default tracer entry points
// ==============================================================================
// These use default_tracer(); the first recorded frame is the caller of the
// function.

/**
 * @brief New error with a stack trace
 */
CORE_NOINLINE ErrorPtr new_error(const std::string& message);

/**
 * @brief New error with a printf-style formatted message and a stack trace
 */
CORE_NOINLINE ErrorPtr errorf(const char* format, ...) CORE_PRINTF_FORMAT(1, 2);

/**
 * @brief Attach a stack trace to err unless it already has one
 *
 * Returns null for null input and err itself when it already carries a
 * trace. When err wraps a traced error somewhere down its unwrap chain, the
 * result reuses that trace instead of capturing a new one.
 */
CORE_NOINLINE ErrorPtr wrap(const ErrorPtr& err);

/**
 * @brief The original error of a traced error; other errors pass through
 */
ErrorPtr unwrap(const ErrorPtr& err);

/**
 * @brief Traced error built from caller-supplied frames, no capture
 */
ErrorPtr custom_error(const ErrorPtr& err, StackTrace frames);

/**
 * @brief Frames carried by err; empty for null or untraced errors
 */
StackTrace stack_trace(const ErrorPtr& err);

/**
 * @brief Creates traced errors with one fixed capture configuration
 *
 * skip_depth counts the frames between the capturer and the user's call
 * site. The library's own entry points account for DEFAULT_FRAME_SKIP_COUNT;
 * a library that wraps a Tracer behind its own function adds one per extra
 * frame.
 */
class Tracer {
public:
    explicit Tracer(CaptureConfig config = CaptureConfig::defaults());
    Tracer(size_t frame_capacity, size_t skip_depth);

    CORE_NOINLINE ErrorPtr new_error(const std::string& message) const;
    CORE_NOINLINE ErrorPtr errorf(const char* format, ...) const CORE_PRINTF_FORMAT(2, 3);
    CORE_NOINLINE ErrorPtr wrap(const ErrorPtr& err) const;

    ErrorPtr unwrap(const ErrorPtr& err) const;
    ErrorPtr custom_error(const ErrorPtr& err, StackTrace frames) const;

    const CaptureConfig& config() const { return capturer_.config(); }

private:
    friend ErrorPtr tracerr::core::error::new_error(const std::string&);
    friend ErrorPtr tracerr::core::error::errorf(const char*, ...);
    friend ErrorPtr tracerr::core::error::wrap(const ErrorPtr&);

    // Capture happens here, exactly one frame below every entry point
    CORE_NOINLINE ErrorPtr trace_new(std::string message) const;
    CORE_NOINLINE ErrorPtr trace_wrap(const ErrorPtr& err) const;

    StackCapturer capturer_;
    std::shared_ptr<logging::Logger> logger_;
};

/**
 * @brief Process-wide tracer behind the free functions
 *
 * Built on first use from CaptureConfig::defaults(). Changing the defaults
 * afterwards does not affect it.
 */
const Tracer& default_tracer();

} // namespace tracerr::core::error

#endif // CORE_ERROR_TRACED_ERROR_H
