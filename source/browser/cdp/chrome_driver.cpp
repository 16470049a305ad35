#include "browser/cdp/chrome_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/driver_errors.hpp"
#include "http/json_http.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace cdp_driver {

using browser_driver::DebugTarget;

std::vector<DebugTarget> parse_target_list(const json &pages) {
    if (!pages.is_array()) {
        throw driver_errors::UnknownProtocolResult(pages.dump());
    }

    std::vector<DebugTarget> targets;
    for (const auto &page : pages) {
        if (!page.is_object() || !page.contains("webSocketDebuggerUrl") ||
            !page["webSocketDebuggerUrl"].is_string()) {
            debug_log::log("Skipping target without debugger URL: " + page.dump());
            continue;
        }
        DebugTarget target;
        target.id = page.value("id", std::string());
        target.type = page.value("type", std::string());
        target.title = page.value("title", std::string());
        target.url = page.value("url", std::string());
        target.websocket_url = page["webSocketDebuggerUrl"].get<std::string>();
        targets.push_back(std::move(target));
    }
    return targets;
}

std::unique_ptr<ChromeDriver> ChromeDriver::spawn(const browser_driver::DriverOptions &options) {
    if (options.kill_existing_instances) {
        cdp_chrome_launch::kill_stale_instances(options.stale_process_names);
    }

    cdp_chrome_launch::ChromeCommandLine command_line = cdp_chrome_launch::build_chrome_command_line(options);
    if (command_line.executable_path.empty()) {
        throw driver_errors::SpawnError(
            "Could not find Chrome executable on this system. Install google-chrome or chromium, "
            "or set CDPDRIVE_CHROME to its path.");
    }

    const std::string user_data_directory = options.user_data_directory.empty()
                                                ? cdp_chrome_launch::default_user_data_directory(options.port)
                                                : options.user_data_directory;
    std::error_code directory_error;
    std::filesystem::create_directories(user_data_directory, directory_error);
    if (directory_error) {
        debug_log::log("Could not create profile directory " + user_data_directory + ": " +
                       directory_error.message());
    }

    browser_driver::ProcessHandle process =
        browser_driver::ProcessHandle::spawn(command_line.executable_path, command_line.arguments);
    debug_log::notice("Chrome launched (pid=" + std::to_string(process.pid()) +
                      ", port=" + std::to_string(options.port) + ")");

    auto driver = std::make_unique<ChromeDriver>(std::move(process), options.port);
    if (options.wait_until_ready) {
        driver->wait_until_ready(options.readiness_policy);
    }
    return driver;
}

ChromeDriver::ChromeDriver(browser_driver::ProcessHandle process, int port)
    : process_(std::move(process)), port_(port) {}

bool ChromeDriver::is_alive() {
    return process_.is_alive();
}

void ChromeDriver::kill() {
    if (process_.is_alive()) {
        debug_log::notice("Killing Chrome (pid=" + std::to_string(process_.pid()) + ")");
    }
    process_.kill();
}

void ChromeDriver::check_is_alive() {
    if (!is_alive()) {
        throw driver_errors::ProcessNotRunning("Chrome (pid=" + std::to_string(process_.pid()) +
                                               ") is not running");
    }
}

std::vector<DebugTarget> ChromeDriver::list_targets() {
    check_is_alive();
    return parse_target_list(json_http::get(cdp_chrome_launch::build_discovery_url(port_)));
}

std::unique_ptr<DebugChannel> ChromeDriver::open_channel(std::size_t index) {
    std::vector<DebugTarget> targets = list_targets();
    if (index >= targets.size()) {
        throw driver_errors::TargetNotFound("No debug target at index " + std::to_string(index) + " (" +
                                            std::to_string(targets.size()) + " available)");
    }
    debug_log::log("Opening channel to target " + targets[index].id + " (" + targets[index].url + ")");
    return std::make_unique<DebugChannel>(targets[index].websocket_url);
}

void ChromeDriver::wait_until_ready(const retry::RetryPolicy &policy) {
    using TargetsAttempt = retry::Attempt<std::vector<DebugTarget>>;

    // Listening: the discovery endpoint answers and lists a target.
    retry::RetryWaiter(policy).until(
        [this](auto &fetch_targets) -> TargetsAttempt {
            if (!is_alive()) {
                return TargetsAttempt::fatal(std::make_exception_ptr(driver_errors::ProcessNotRunning(
                    "Chrome exited before its debugging port came up")));
            }
            try {
                std::vector<DebugTarget> targets = fetch_targets();
                if (targets.empty()) {
                    return TargetsAttempt::retry("Discovery endpoint lists no targets yet");
                }
                return TargetsAttempt::success(std::move(targets));
            } catch (const driver_errors::ConnectionError &error) {
                return TargetsAttempt::retry(error.what());
            }
        },
        [this] { return list_targets(); });

    // Interactive: the first page evaluates scripts.
    std::unique_ptr<DebugChannel> channel = open_channel(0);
    retry::RetryWaiter(policy).until_no_exception<driver_errors::JsExecutionError>(
        [&channel] { return channel->run_js_get_value("document.body.innerText;"); });
    debug_log::log("Chrome on port " + std::to_string(port_) + " is ready.");
}

} // namespace cdp_driver
