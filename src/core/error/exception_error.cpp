#include "exception_error.h"

namespace tracerr::core::error {

namespace {

std::string describe(const std::exception_ptr& exception) {
    try {
        std::rethrow_exception(exception);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

ErrorPtr nested_of(const std::exception_ptr& exception) {
    try {
        std::rethrow_exception(exception);
    } catch (const std::nested_exception& nested) {
        return from_exception(nested.nested_ptr());
    } catch (...) {
        return nullptr;
    }
}

} // namespace

void raise(const ErrorPtr& err) {
    if (!err) {
        throw std::invalid_argument("tracerr: cannot raise a null error");
    }
    throw TracedException(err);
}

ExceptionError::ExceptionError(std::exception_ptr exception)
    : exception_(std::move(exception))
    , message_(exception_ ? describe(exception_) : std::string())
    , nested_(exception_ ? nested_of(exception_) : nullptr) {
}

void ExceptionError::rethrow() const {
    if (!exception_) {
        throw std::logic_error("tracerr: ExceptionError holds no exception");
    }
    std::rethrow_exception(exception_);
}

ErrorPtr from_exception(const std::exception_ptr& exception) {
    if (!exception) {
        return nullptr;
    }

    try {
        std::rethrow_exception(exception);
    } catch (const TracedException& traced) {
        if (traced.error()) {
            return traced.error();
        }
    } catch (...) {
        // Every other exception is adapted below
    }

    return std::make_shared<ExceptionError>(exception);
}

ErrorPtr from_current_exception() {
    return from_exception(std::current_exception());
}

} // namespace tracerr::core::error
