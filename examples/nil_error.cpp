#include <iostream>

#include <core/error/source_printer.h>
#include <core/error/traced_error.h>

namespace err = tracerr::core::error;

namespace {

err::ErrorPtr nil_error() {
    return err::wrap(nullptr);
}

} // namespace

int main() {
    if (err::ErrorPtr e = nil_error()) {
        err::print_source_color(e);
        return 1;
    }

    std::cout << "no error" << std::endl;
    return 0;
}
