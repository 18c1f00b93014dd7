#include "traced_error.h"

#include <cstdarg>

#include "../logging/logger.h"
#include "../logging/loggermanager.h"

namespace tracerr::core::error {

namespace {

// First error in the unwrap chain below err that carries a trace
const HasStackTrace* find_inner_trace(const ErrorPtr& err) {
    for (ErrorPtr current = err->unwrap(); current; current = current->unwrap()) {
        if (auto* traced = dynamic_cast<const HasStackTrace*>(current.get())) {
            return traced;
        }
    }
    return nullptr;
}

} // namespace

// ==============================================================================
// Tracer
// ==============================================================================

Tracer::Tracer(CaptureConfig config)
    : capturer_(config)
    , logger_(logging::get_logger("tracerr.error")) {
}

Tracer::Tracer(size_t frame_capacity, size_t skip_depth)
    : Tracer(CaptureConfig{frame_capacity, skip_depth}) {
}

ErrorPtr Tracer::new_error(const std::string& message) const {
    return trace_new(message);
}

ErrorPtr Tracer::errorf(const char* format, ...) const {
    std::va_list args;
    va_start(args, format);
    std::string message = vformat_message(format, args);
    va_end(args);

    return trace_new(std::move(message));
}

ErrorPtr Tracer::wrap(const ErrorPtr& err) const {
    return trace_wrap(err);
}

ErrorPtr Tracer::unwrap(const ErrorPtr& err) const {
    return error::unwrap(err);
}

ErrorPtr Tracer::custom_error(const ErrorPtr& err, StackTrace frames) const {
    return error::custom_error(err, std::move(frames));
}

ErrorPtr Tracer::trace_new(std::string message) const {
    StackTrace frames = capturer_.capture();

    TRACERR_LOG_TRACE(logger_, "captured ", frames.size(), " frames for new error: ", message);
    if (frames.empty()) {
        TRACERR_LOG_DEBUG(logger_, "stack walk returned no frames");
    }

    return std::make_shared<TracedError>(make_error(std::move(message)), std::move(frames));
}

ErrorPtr Tracer::trace_wrap(const ErrorPtr& err) const {
    if (!err) {
        return nullptr;
    }

    if (dynamic_cast<const HasStackTrace*>(err.get()) != nullptr) {
        return err;
    }

    if (const HasStackTrace* inner = find_inner_trace(err)) {
        TRACERR_LOG_TRACE(logger_, "reusing ", inner->stack_trace().size(),
                          " frames of wrapped error: ", err->message());

        // Same message byte for byte; unwrapping leads back to err
        auto rewrapped = std::make_shared<WrappedError>(err->message(), err);
        return std::make_shared<TracedError>(std::move(rewrapped), inner->stack_trace());
    }

    StackTrace frames = capturer_.capture();

    TRACERR_LOG_TRACE(logger_, "captured ", frames.size(), " frames for wrapped error: ",
                      err->message());
    if (frames.empty()) {
        TRACERR_LOG_DEBUG(logger_, "stack walk returned no frames");
    }

    return std::make_shared<TracedError>(err, std::move(frames));
}

const Tracer& default_tracer() {
    static const Tracer tracer{CaptureConfig::defaults()};
    return tracer;
}

// ==============================================================================
// Free functions
// ==============================================================================

ErrorPtr new_error(const std::string& message) {
    return default_tracer().trace_new(message);
}

ErrorPtr errorf(const char* format, ...) {
    std::va_list args;
    va_start(args, format);
    std::string message = vformat_message(format, args);
    va_end(args);

    return default_tracer().trace_new(std::move(message));
}

ErrorPtr wrap(const ErrorPtr& err) {
    return default_tracer().trace_wrap(err);
}

ErrorPtr unwrap(const ErrorPtr& err) {
    if (!err) {
        return nullptr;
    }
    if (dynamic_cast<const HasStackTrace*>(err.get()) == nullptr) {
        return err;
    }
    return err->unwrap();
}

ErrorPtr custom_error(const ErrorPtr& err, StackTrace frames) {
    if (!err) {
        return nullptr;
    }
    return std::make_shared<TracedError>(err, std::move(frames));
}

StackTrace stack_trace(const ErrorPtr& err) {
    if (auto* traced = dynamic_cast<const HasStackTrace*>(err.get())) {
        return traced->stack_trace();
    }
    return StackTrace();
}

} // namespace tracerr::core::error
