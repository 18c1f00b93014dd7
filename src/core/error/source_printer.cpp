#include "source_printer.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <vector>

#include "stack_trace.h"
#include "traced_error.h"
#include "../logging/logger.h"
#include "../logging/loggermanager.h"

namespace tracerr::core::error {

namespace {

constexpr std::string_view COLOR_RED = "\033[31m";
constexpr std::string_view COLOR_BOLD = "\033[1m";
constexpr std::string_view COLOR_DIM = "\033[2m";
constexpr std::string_view COLOR_RESET = "\033[0m";

using SourceLines = std::vector<std::string>;

/**
 * @brief Reads each source file at most once per print
 */
class SourceCache {
public:
    explicit SourceCache(std::shared_ptr<logging::Logger> logger)
        : logger_(std::move(logger)) {}

    // Null when the file cannot be read
    const SourceLines* lines(const std::string& path) {
        auto it = files_.find(path);
        if (it != files_.end()) {
            return it->second ? &*it->second : nullptr;
        }

        std::optional<SourceLines> loaded;
        std::ifstream in(path);
        if (in) {
            loaded.emplace();
            std::string line;
            while (std::getline(in, line)) {
                loaded->push_back(std::move(line));
            }
        } else {
            TRACERR_LOG_DEBUG(logger_, "cannot read source file: ", path);
        }

        auto inserted = files_.emplace(path, std::move(loaded)).first;
        return inserted->second ? &*inserted->second : nullptr;
    }

private:
    std::shared_ptr<logging::Logger> logger_;
    std::map<std::string, std::optional<SourceLines>> files_;
};

void append_colored(std::ostringstream& oss, std::string_view color,
                    const std::string& text, bool colorized) {
    if (colorized) {
        oss << color << text << COLOR_RESET;
    } else {
        oss << text;
    }
}

void append_source(std::ostringstream& oss, const SourceLines& lines,
                   line_type target, const SourceOptions& options) {
    size_t center = static_cast<size_t>(target);
    size_t first = center > options.lines_before ? center - options.lines_before : 1;
    size_t last = std::min(lines.size(), center + options.lines_after);

    size_t width = std::to_string(last).size();

    for (size_t number = first; number <= last; ++number) {
        std::ostringstream row;
        row << (number == center ? ">" : " ") << "   "
            << std::setw(static_cast<int>(width)) << number
            << " | " << lines[number - 1];

        if (number == center) {
            append_colored(oss, COLOR_RED, row.str(), options.colorized);
        } else {
            append_colored(oss, COLOR_DIM, row.str(), options.colorized);
        }
        oss << "\n";
    }
}

} // namespace

std::string sprint(const ErrorPtr& err) {
    if (!err) {
        return "";
    }

    std::ostringstream oss;
    oss << err->message();
    for (const auto& frame : stack_trace(err)) {
        oss << "\n" << frame.to_string();
    }
    return oss.str();
}

std::string sprint_source(const ErrorPtr& err, const SourceOptions& options) {
    if (!err) {
        return "";
    }

    SourceCache cache(logging::get_logger("tracerr.source"));
    StackTrace trace = stack_trace(err);

    std::ostringstream oss;
    append_colored(oss, COLOR_RED, err->message(), options.colorized);
    oss << "\n";

    size_t shown = 0;
    for (const auto& frame : trace) {
        if (shown++ == options.max_frames) {
            break;
        }

        oss << "\n";
        append_colored(oss, COLOR_BOLD, frame.to_string(), options.colorized);
        oss << "\n";

        if (frame.path.empty() || frame.line == 0) {
            continue;
        }

        const SourceLines* lines = cache.lines(frame.path);
        if (lines == nullptr || static_cast<size_t>(frame.line) > lines->size()) {
            continue;
        }

        append_source(oss, *lines, frame.line, options);
    }

    return oss.str();
}

void print_source(const ErrorPtr& err, std::ostream& os) {
    os << sprint_source(err) << std::flush;
}

void print_source_color(const ErrorPtr& err, std::ostream& os) {
    SourceOptions options;
    options.colorized = true;
    os << sprint_source(err, options) << std::flush;
}

} // namespace tracerr::core::error
