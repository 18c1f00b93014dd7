#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <core/error/exception_error.h>
#include <core/error/source_printer.h>
#include <core/error/traced_error.h>
#include <core/logging/loggermanager.h>

namespace err = tracerr::core::error;
namespace logging = tracerr::core::logging;

namespace {

CORE_NOINLINE err::ErrorPtr read_port(const std::string& value) {
    try {
        return std::stoi(value) > 0 ? nullptr : err::errorf("port %s is not positive", value.c_str());
    } catch (const std::exception&) {
        return err::wrap(err::from_current_exception());
    }
}

CORE_NOINLINE err::ErrorPtr load_config(const std::string& port) {
    err::ErrorPtr e = read_port(port);
    if (e) {
        return err::wrap(err::make_wrapped("loading config", e));
    }
    return nullptr;
}

} // namespace

// Usage: tracerr_source_trace [port] [--verbose]
int main(int argc, char** argv) {
    std::string port = argc > 1 ? argv[1] : "-1";

    if (argc > 2 && std::string(argv[2]) == "--verbose") {
        // The default console sink stops at INFO
        auto verbose = std::make_shared<logging::ConsoleSink>();
        verbose->set_level(logging::LogLevel::TRACE);
        logging::get_logger("tracerr.error")->add_sink(verbose);
        logging::get_logger("tracerr.source")->add_sink(verbose);
        logging::LoggerManager::instance().set_level("tracerr", logging::LogLevel::TRACE);
    }

    err::ErrorPtr e = load_config(port);
    if (!e) {
        std::cout << "config loaded" << std::endl;
        return EXIT_SUCCESS;
    }

    err::print_source_color(e);
    return EXIT_FAILURE;
}
