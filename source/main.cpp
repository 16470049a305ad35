// cdpdrive – browser driver service
// Entry point: stdio JSON-RPC loop in front of one DriverManager.
//
// Reads JSON-RPC 2.0 messages from stdin, runs them against the browser,
// writes responses to stdout. Logs go to stderr.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include "browser/driver_manager.hpp"
#include "config/driver_config.hpp"
#include "protocol/json_rpc.hpp"
#include "service/commands/commands.hpp"
#include "service/service.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main(int argc, char **argv) {
    for (int index = 1; index < argc; ++index) {
        if (std::strcmp(argv[index], "--help") == 0 || std::strcmp(argv[index], "-h") == 0) {
            std::cout << config::usage_text();
            return 0;
        }
    }

    browser_driver::DriverOptions options;
    try {
        options = config::load_driver_options(argc, argv);
    } catch (const std::invalid_argument &error) {
        std::cerr << "[cdpdrive] " << error.what() << std::endl << config::usage_text();
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    service_commands::register_all_commands();
    browser_driver::DriverManager manager(options);

    debug_log::notice("cdpdrive started on debugging port " + std::to_string(options.port) +
                      (options.headless ? " (headless)" : "") + ". Waiting for requests on stdin.");

    while (!shutdown_requested) {
        std::string raw_message = service_stdio::read_message(std::cin);
        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::log("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::notice("Failed to parse incoming JSON: " + std::string(error.what()));
            service_stdio::write_message(
                std::cout, json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error").dump());
            continue;
        }

        json response = service_dispatch::dispatch_message(parsed_message, manager);
        if (response.is_null()) {
            continue;
        }
        service_stdio::write_message(std::cout, response.dump());
    }

    manager.quit();
    debug_log::notice("cdpdrive shut down.");
    return 0;
}
