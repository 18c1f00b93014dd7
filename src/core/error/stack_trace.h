#pragma once

#ifndef CORE_ERROR_STACK_TRACE_H
#define CORE_ERROR_STACK_TRACE_H

#include <vector>
#include <string>
#include <optional>
#include <ostream>

#include "../config/config.h"
#include "../config/capture_config.h"

namespace tracerr::core::error {

using line_type = tracerr::config::line_type;
using core::config::CaptureConfig;

/**
 * @brief One call site of a captured stack
 */
struct StackFrame {
    std::string function;        // Demangled function name, empty if unknown
    std::string path;            // Source file path, empty if unknown
    line_type line = 0;          // Line number, 0 if unknown

    /**
     * @brief Format frame as "<path>:<line> <function>()"
     */
    std::string to_string() const;

    /**
     * @brief Check if frame is from the runtime or a system library
     */
    bool is_system() const;

    bool operator==(const StackFrame&) const = default;
};

std::ostream& operator<<(std::ostream& os, const StackFrame& frame);

/**
 * @brief Ordered call frames, innermost call first
 */
class StackTrace {
public:
    using const_iterator = std::vector<StackFrame>::const_iterator;

    /**
     * @brief Empty trace
     */
    StackTrace() = default;

    /**
     * @brief Trace built from caller-supplied frames
     */
    explicit StackTrace(std::vector<StackFrame> frames)
        : frames_(std::move(frames)) {}

    /**
     * @brief Capture the current call stack
     *
     * With skip 0 the first frame is the function that called capture();
     * every extra unit of skip drops one more caller. capacity_hint only
     * sizes the initial allocation. Frames are resolved until the stack walk
     * runs out; a failed walk returns an empty trace.
     */
    CORE_NOINLINE static StackTrace capture(size_t skip = 0,
                                            size_t capacity_hint = tracerr::config::DEFAULT_FRAME_CAPACITY);

    const std::vector<StackFrame>& frames() const { return frames_; }

    bool empty() const { return frames_.empty(); }

    size_t size() const { return frames_.size(); }

    const StackFrame& operator[](size_t index) const {
        return frames_.at(index);
    }

    const_iterator begin() const { return frames_.begin(); }
    const_iterator end() const { return frames_.end(); }

    /**
     * @brief One frame per line, indented
     */
    std::string to_string(bool include_system_frames = true) const;

    /**
     * @brief Get top N frames
     */
    StackTrace top(size_t n) const;

    /**
     * @brief Remove frames of the runtime and system libraries
     */
    StackTrace without_system_frames() const;

    /**
     * @brief Find first frame whose function or path contains pattern
     */
    std::optional<StackFrame> find_frame(const std::string& pattern) const;

    bool operator==(const StackTrace&) const = default;

private:
    std::vector<StackFrame> frames_;
};

std::ostream& operator<<(std::ostream& os, const StackTrace& trace);

/**
 * @brief Frame capturer bound to one capture configuration
 *
 * skip_depth counts frames above the caller of capture(); the capturer's own
 * frame is never recorded. A library that reaches capture() through N frames
 * of its own uses skip_depth N so that recording starts at its user.
 */
class StackCapturer {
public:
    explicit StackCapturer(CaptureConfig config = CaptureConfig::defaults())
        : config_(config) {}

    CORE_NOINLINE StackTrace capture() const;

    const CaptureConfig& config() const { return config_; }

private:
    CaptureConfig config_;
};

} // namespace tracerr::core::error

#endif // CORE_ERROR_STACK_TRACE_H
