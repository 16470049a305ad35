// Tests for the Chrome launch command-line building logic and the parsing of
// discovery data, WITHOUT actually spawning a browser.

#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/cdp/chrome_driver.hpp"
#include "browser/cdp/websocket_transport.hpp"
#include "browser/driver_errors.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <algorithm>
#include <vector>

namespace test_chrome_launch {

using json = nlohmann::json;

static bool check_argument_present(const std::vector<std::string> &arguments,
                                   const std::string &expected_prefix,
                                   const std::string &test_description) {
    bool found = false;
    for (const auto &argument : arguments) {
        if (argument.find(expected_prefix) == 0) {
            found = true;
            break;
        }
    }
    if (!found) {
        std::cout << "  FAIL: " << test_description << " (expected prefix '"
                  << expected_prefix << "' not found in arguments)" << std::endl;
    } else {
        std::cout << "  OK: " << test_description << std::endl;
    }
    return found;
}

static bool report(bool passed, const std::string &description) {
    std::cout << (passed ? "  OK: " : "  FAIL: ") << description << std::endl;
    return passed;
}

static browser_driver::DriverOptions options_for_port(int port) {
    browser_driver::DriverOptions options;
    options.port = port;
    return options;
}

// Test: the debugging port and origin flags are set from the options.
static bool test_command_line_has_remote_debugging_port() {
    auto command_line = cdp_chrome_launch::build_chrome_command_line(options_for_port(9333));
    return check_argument_present(command_line.arguments, "--remote-debugging-port=9333",
                                  "Command line contains --remote-debugging-port=9333") &&
           check_argument_present(command_line.arguments, "--remote-allow-origins=*",
                                  "Command line allows any debugger origin");
}

// Test: a configured profile directory wins over the per-port default.
static bool test_command_line_has_user_data_directory() {
    bool all_passed = true;
    auto default_command_line = cdp_chrome_launch::build_chrome_command_line(options_for_port(9334));
    all_passed &= check_argument_present(default_command_line.arguments,
                                         "--user-data-dir=" + cdp_chrome_launch::default_user_data_directory(9334),
                                         "Default profile directory is derived from the port");

    browser_driver::DriverOptions options = options_for_port(9334);
    options.user_data_directory = "/tmp/cdpdrive_test_profile_xyz";
    auto command_line = cdp_chrome_launch::build_chrome_command_line(options);
    all_passed &= check_argument_present(command_line.arguments, "--user-data-dir=/tmp/cdpdrive_test_profile_xyz",
                                         "Command line contains --user-data-dir with correct path");
    return all_passed;
}

// Test: headless only when asked; extra arguments precede the start URL.
static bool test_command_line_headless_and_extras() {
    auto windowed = cdp_chrome_launch::build_chrome_command_line(options_for_port(9335));
    bool windowed_ok = std::find(windowed.arguments.begin(), windowed.arguments.end(), "--headless") ==
                       windowed.arguments.end();

    browser_driver::DriverOptions options = options_for_port(9335);
    options.headless = true;
    options.extra_arguments = {"--window-size=800,600"};
    auto headless = cdp_chrome_launch::build_chrome_command_line(options);
    bool headless_ok = std::find(headless.arguments.begin(), headless.arguments.end(), "--headless") !=
                       headless.arguments.end();
    bool order_ok = headless.arguments.size() >= 2 && headless.arguments.back() == "about:blank" &&
                    headless.arguments[headless.arguments.size() - 2] == "--window-size=800,600";

    return report(windowed_ok && headless_ok && order_ok,
                  "--headless follows the option; extra arguments come right before about:blank") &&
           check_argument_present(headless.arguments, "--no-first-run", "Command line contains --no-first-run");
}

// Test: Chrome executable path is non-empty (Chrome must be installed for this).
static bool test_chrome_executable_found() {
    std::string executable = cdp_chrome_launch::find_chrome_executable();
    if (executable.empty()) {
        std::cout << "  WARN: Chrome executable not found (not installed?). "
                  << "This test is informational only." << std::endl;
        return true;
    }
    std::cout << "  OK: Chrome executable found at: " << executable << std::endl;
    return true;
}

// Test: an explicit executable path that does not exist yields no executable.
static bool test_missing_preferred_executable() {
    return report(cdp_chrome_launch::find_chrome_executable("/nonexistent/chrome").empty(),
                  "Missing preferred executable is not replaced by a guess");
}

// Test: the discovery endpoint URL.
static bool test_discovery_url() {
    return report(cdp_chrome_launch::build_discovery_url(9222) == "http://localhost:9222/json",
                  "Discovery URL is http://localhost:<port>/json");
}

// Test: discovery entries become targets; entries without a debugger URL are skipped.
static bool test_parse_target_list() {
    json pages = json::array({
        {{"id", "A1"}, {"type", "page"}, {"title", "Example"}, {"url", "https://example.com/"},
         {"webSocketDebuggerUrl", "ws://localhost:9222/devtools/page/A1"}},
        {{"id", "B2"}, {"type", "page"}, {"title", "Attached"}, {"url", "about:blank"}},
        {{"id", "C3"}, {"type", "service_worker"}, {"url", "https://example.com/sw.js"},
         {"webSocketDebuggerUrl", "ws://localhost:9222/devtools/page/C3"}},
    });
    auto targets = cdp_driver::parse_target_list(pages);
    bool parsed = targets.size() == 2 && targets[0].id == "A1" && targets[0].title == "Example" &&
                  targets[0].websocket_url == "ws://localhost:9222/devtools/page/A1" &&
                  targets[1].type == "service_worker" && targets[1].title.empty();

    bool rejected = false;
    try {
        cdp_driver::parse_target_list(json{{"error", "not a list"}});
    } catch (const driver_errors::UnknownProtocolResult &) {
        rejected = true;
    }
    return report(parsed && rejected, "Target list keeps order, skips attached targets, rejects non-arrays");
}

// Test: WebSocket debugger URL parsing.
static bool test_parse_websocket_url() {
    auto address = cdp_driver::parse_websocket_url("ws://localhost:9222/devtools/page/ABC");
    bool parsed = address.host == "localhost" && address.port == 9222 && address.path == "/devtools/page/ABC";

    bool bad_scheme = false;
    try {
        cdp_driver::parse_websocket_url("http://localhost:9222/json");
    } catch (const driver_errors::ConnectionError &) {
        bad_scheme = true;
    }
    bool bad_port = false;
    try {
        cdp_driver::parse_websocket_url("ws://localhost:notaport/devtools");
    } catch (const driver_errors::ConnectionError &) {
        bad_port = true;
    }
    return report(parsed && bad_scheme && bad_port, "ws:// URLs split into host, port and path; bad URLs rejected");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_command_line_has_remote_debugging_port();
    all_passed &= test_command_line_has_user_data_directory();
    all_passed &= test_command_line_headless_and_extras();
    all_passed &= test_chrome_executable_found();
    all_passed &= test_missing_preferred_executable();
    all_passed &= test_discovery_url();
    all_passed &= test_parse_target_list();
    all_passed &= test_parse_websocket_url();
    return all_passed;
}

} // namespace test_chrome_launch
