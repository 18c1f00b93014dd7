#pragma once

#ifndef CORE_ERROR_SOURCE_PRINTER_H
#define CORE_ERROR_SOURCE_PRINTER_H

#include <iostream>
#include <limits>
#include <string>

#include "../config/config.h"
#include "error.h"

namespace tracerr::core::error {

/**
 * @brief Controls how much source is shown around each frame
 */
struct SourceOptions {
    size_t lines_before = tracerr::config::DEFAULT_SOURCE_LINES_BEFORE;
    size_t lines_after = tracerr::config::DEFAULT_SOURCE_LINES_AFTER;
    bool colorized = false;
    size_t max_frames = std::numeric_limits<size_t>::max();
};

/**
 * @brief Message followed by one line per frame
 *
 * Returns "" for null. An error without a trace prints its message only.
 */
std::string sprint(const ErrorPtr& err);

/**
 * @brief Message followed by every frame and the source lines around it
 *
 * Layout per frame:
 * @code
 * /path/to/file.cpp:42 ns::function()
 *     40 | context line
 *     41 | context line
 * >   42 | the frame's line
 *     43 | context line
 * @endcode
 * Frames whose file cannot be read, or whose line lies outside the file,
 * show the header line only.
 */
std::string sprint_source(const ErrorPtr& err, const SourceOptions& options = SourceOptions{});

/**
 * @brief Write sprint_source() with default options to os
 */
void print_source(const ErrorPtr& err, std::ostream& os = std::cerr);

/**
 * @brief Write a colorized sprint_source() to os
 */
void print_source_color(const ErrorPtr& err, std::ostream& os = std::cerr);

} // namespace tracerr::core::error

#endif // CORE_ERROR_SOURCE_PRINTER_H
