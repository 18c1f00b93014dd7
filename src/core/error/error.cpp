#include "error.h"

#include <cstdio>
#include <sstream>

namespace tracerr::core::error {

ErrorPtr make_error(std::string message) {
    return std::make_shared<SimpleError>(std::move(message));
}

ErrorPtr make_wrapped(const std::string& context, ErrorPtr cause) {
    if (!cause) {
        return make_error(context);
    }
    std::string message = context + ": " + cause->message();
    return std::make_shared<WrappedError>(std::move(message), std::move(cause));
}

bool is(const ErrorPtr& err, const ErrorPtr& target) {
    if (!target) {
        return !err;
    }
    for (ErrorPtr current = err; current; current = current->unwrap()) {
        if (current == target) {
            return true;
        }
    }
    return false;
}

ErrorPtr root_cause(const ErrorPtr& err) {
    ErrorPtr current = err;
    while (current) {
        ErrorPtr next = current->unwrap();
        if (!next) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

std::vector<std::string> extract_chain(const ErrorPtr& err) {
    std::vector<std::string> chain;
    for (ErrorPtr current = err; current; current = current->unwrap()) {
        chain.push_back(current->message());
    }
    return chain;
}

std::string format_chain(const ErrorPtr& err, const std::string& separator) {
    auto chain = extract_chain(err);
    if (chain.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << chain[0];
    for (size_t i = 1; i < chain.size(); ++i) {
        oss << separator << chain[i];
    }
    return oss.str();
}

std::string message_of(const ErrorPtr& err) {
    return err ? err->message() : std::string();
}

std::string format_message(const char* format, ...) {
    std::va_list args;
    va_start(args, format);
    std::string result = vformat_message(format, args);
    va_end(args);
    return result;
}

std::string vformat_message(const char* format, std::va_list args) {
    if (format == nullptr) {
        return "";
    }

    std::va_list measure;
    va_copy(measure, args);
    int length = std::vsnprintf(nullptr, 0, format, measure);
    va_end(measure);

    // Encoding errors leave the format string as the message
    if (length < 0) {
        return format;
    }

    std::string result(static_cast<size_t>(length), '\0');
    std::vsnprintf(result.data(), result.size() + 1, format, args);
    return result;
}

} // namespace tracerr::core::error
