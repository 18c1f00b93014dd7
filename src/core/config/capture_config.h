#pragma once

#ifndef CORE_CONFIG_CAPTURE_CONFIG_H
#define CORE_CONFIG_CAPTURE_CONFIG_H

#include <string>

#include "config.h"

// ==============================================================================
// Stack Capture Configuration
// ==============================================================================
// Runtime counterpart of the trace defaults in config.h. A CaptureConfig is a
// plain value: tracers copy it at construction and never look at the process
// defaults again.
// ==============================================================================

namespace tracerr::core::config {

using size_type = tracerr::config::size_type;

/**
 * @brief Frame capacity hint and skip depth for one capturer
 */
struct CaptureConfig {
    size_type frame_capacity = tracerr::config::DEFAULT_FRAME_CAPACITY;
    size_type skip_depth = tracerr::config::DEFAULT_FRAME_SKIP_COUNT;

    /**
     * @brief Snapshot of the current process-wide defaults
     */
    static CaptureConfig defaults() noexcept;

    /**
     * @brief Copy with a different capacity hint
     */
    CaptureConfig with_frame_capacity(size_type capacity) const noexcept {
        CaptureConfig copy = *this;
        copy.frame_capacity = capacity;
        return copy;
    }

    /**
     * @brief Copy with a different skip depth
     */
    CaptureConfig with_skip_depth(size_type depth) const noexcept {
        CaptureConfig copy = *this;
        copy.skip_depth = depth;
        return copy;
    }

    std::string to_string() const;

    bool operator==(const CaptureConfig&) const = default;
};

// Process-wide defaults. They are read when a default-configured tracer is
// constructed; already constructed tracers keep the values they copied.
void set_default_frame_capacity(size_type capacity) noexcept;
void set_default_frame_skip_count(size_type skip) noexcept;

size_type default_frame_capacity() noexcept;
size_type default_frame_skip_count() noexcept;

// Restores the compile-time values from config.h
void reset_capture_defaults() noexcept;

} // namespace tracerr::core::config

#endif // CORE_CONFIG_CAPTURE_CONFIG_H
