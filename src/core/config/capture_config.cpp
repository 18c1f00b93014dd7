#include "capture_config.h"

#include <atomic>
#include <sstream>

namespace tracerr::core::config {

namespace {

std::atomic<size_type>& frame_capacity_slot() noexcept {
    static std::atomic<size_type> slot{tracerr::config::DEFAULT_FRAME_CAPACITY};
    return slot;
}

std::atomic<size_type>& skip_count_slot() noexcept {
    static std::atomic<size_type> slot{tracerr::config::DEFAULT_FRAME_SKIP_COUNT};
    return slot;
}

} // namespace

CaptureConfig CaptureConfig::defaults() noexcept {
    CaptureConfig config;
    config.frame_capacity = default_frame_capacity();
    config.skip_depth = default_frame_skip_count();
    return config;
}

std::string CaptureConfig::to_string() const {
    std::ostringstream oss;
    oss << "CaptureConfig(frame_capacity=" << frame_capacity
        << ", skip_depth=" << skip_depth << ")";
    return oss.str();
}

void set_default_frame_capacity(size_type capacity) noexcept {
    frame_capacity_slot().store(capacity, std::memory_order_relaxed);
}

void set_default_frame_skip_count(size_type skip) noexcept {
    skip_count_slot().store(skip, std::memory_order_relaxed);
}

size_type default_frame_capacity() noexcept {
    return frame_capacity_slot().load(std::memory_order_relaxed);
}

size_type default_frame_skip_count() noexcept {
    return skip_count_slot().load(std::memory_order_relaxed);
}

void reset_capture_defaults() noexcept {
    set_default_frame_capacity(tracerr::config::DEFAULT_FRAME_CAPACITY);
    set_default_frame_skip_count(tracerr::config::DEFAULT_FRAME_SKIP_COUNT);
}

} // namespace tracerr::core::config
