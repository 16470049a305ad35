#include "config/driver_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace config {

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    return value == nullptr ? std::string() : std::string(value);
}

static bool parse_flag_value(const std::string &name, const std::string &value) {
    std::string normalized = value;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized.empty()) {
        return false;
    }
    throw std::invalid_argument(name + " must be a boolean, got '" + value + "'");
}

static int parse_port(const std::string &name, const std::string &value) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception &) {
        throw std::invalid_argument(name + " must be a port number, got '" + value + "'");
    }
    if (consumed != value.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument(name + " must be a port number in 1..65535, got '" + value + "'");
    }
    return port;
}

browser_driver::DriverOptions load_driver_options(const std::vector<std::string> &arguments) {
    browser_driver::DriverOptions options;

    const std::string environment_port = read_environment("CDPDRIVE_PORT");
    if (!environment_port.empty()) {
        options.port = parse_port("CDPDRIVE_PORT", environment_port);
    }
    options.headless = parse_flag_value("CDPDRIVE_HEADLESS", read_environment("CDPDRIVE_HEADLESS"));
    options.chrome_executable = read_environment("CDPDRIVE_CHROME");
    options.user_data_directory = read_environment("CDPDRIVE_USER_DATA_DIR");

    for (const auto &argument : arguments) {
        auto value_of = [&argument](const std::string &prefix) { return argument.substr(prefix.size()); };

        if (argument.rfind("--port=", 0) == 0) {
            options.port = parse_port("--port", value_of("--port="));
        } else if (argument == "--headless") {
            options.headless = true;
        } else if (argument == "--keep-existing") {
            options.kill_existing_instances = false;
        } else if (argument == "--no-wait") {
            options.wait_until_ready = false;
        } else if (argument.rfind("--chrome=", 0) == 0) {
            options.chrome_executable = value_of("--chrome=");
        } else if (argument.rfind("--user-data-dir=", 0) == 0) {
            options.user_data_directory = value_of("--user-data-dir=");
        } else {
            throw std::invalid_argument("Unknown argument: " + argument);
        }
    }
    return options;
}

browser_driver::DriverOptions load_driver_options(int argc, char **argv) {
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index) {
        arguments.emplace_back(argv[index]);
    }
    return load_driver_options(arguments);
}

std::string usage_text() {
    return "usage: cdpdrive [--port=N] [--headless] [--keep-existing] [--no-wait] "
           "[--chrome=PATH] [--user-data-dir=DIR]\n"
           "Reads JSON-RPC 2.0 requests on stdin and answers on stdout. "
           "Set CDPDRIVE_DEBUG=1 for debug logs on stderr.\n";
}

} // namespace config
