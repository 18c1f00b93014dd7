#include "stack_trace.h"

#include <algorithm>
#include <sstream>

#include <boost/stacktrace.hpp>

namespace tracerr::core::error {

namespace {

// Collect everything: the capacity hint must never truncate a trace
constexpr std::size_t kUnlimitedDepth = static_cast<std::size_t>(-1);

StackFrame resolve(const boost::stacktrace::frame& raw) {
    StackFrame frame;
    frame.function = raw.name();
    frame.line = raw.source_line();
    if (frame.line > 0) {
        frame.path = raw.source_file();
    }
    return frame;
}

} // namespace

std::string StackFrame::to_string() const {
    std::ostringstream oss;
    oss << path << ":" << line << " " << function << "()";
    return oss.str();
}

bool StackFrame::is_system() const {
    static const std::vector<std::string> system_prefixes = {
        "std::", "__", "_start", "boost::stacktrace::"
    };
    static const std::vector<std::string> system_paths = {
        "/usr/", "/lib/", "../sysdeps/", "./csu/"
    };

    for (const auto& prefix : system_prefixes) {
        if (function.starts_with(prefix)) {
            return true;
        }
    }
    for (const auto& prefix : system_paths) {
        if (path.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const StackFrame& frame) {
    return os << frame.to_string();
}

StackTrace StackTrace::capture(size_t skip, size_t capacity_hint) {
    // Frame 0 of the raw trace is this function
    boost::stacktrace::stacktrace raw(skip + 1, kUnlimitedDepth);

    std::vector<StackFrame> frames;
    frames.reserve(capacity_hint);

    for (const auto& entry : raw) {
        if (entry.empty()) {
            break;
        }
        frames.push_back(resolve(entry));
    }

    return StackTrace(std::move(frames));
}

std::string StackTrace::to_string(bool include_system_frames) const {
    if (frames_.empty()) {
        return "<no stack trace available>";
    }

    std::ostringstream oss;
    for (const auto& frame : frames_) {
        if (!include_system_frames && frame.is_system()) {
            continue;
        }
        oss << "  " << frame.to_string() << "\n";
    }
    return oss.str();
}

StackTrace StackTrace::top(size_t n) const {
    size_t count = std::min(n, frames_.size());
    return StackTrace(std::vector<StackFrame>(frames_.begin(), frames_.begin() + count));
}

StackTrace StackTrace::without_system_frames() const {
    std::vector<StackFrame> filtered;
    for (const auto& frame : frames_) {
        if (!frame.is_system()) {
            filtered.push_back(frame);
        }
    }
    return StackTrace(std::move(filtered));
}

std::optional<StackFrame> StackTrace::find_frame(const std::string& pattern) const {
    for (const auto& frame : frames_) {
        if (frame.function.find(pattern) != std::string::npos ||
            frame.path.find(pattern) != std::string::npos) {
            return frame;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const StackTrace& trace) {
    return os << trace.to_string();
}

StackTrace StackCapturer::capture() const {
    // One extra frame so the capturer itself never shows up
    return StackTrace::capture(config_.skip_depth + 1, config_.frame_capacity);
}

} // namespace tracerr::core::error
