#ifndef CDPDRIVE_CHROME_DRIVER_HPP
#define CDPDRIVE_CHROME_DRIVER_HPP

// A running Chrome with remote debugging enabled.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "browser/process_handle.hpp"

namespace cdp_driver {

using json = nlohmann::json;

class ChromeDriver : public browser_driver::BrowserDriver {
public:
    // Kills stale instances (when configured), spawns Chrome on options.port
    // and, when options.wait_until_ready is set, blocks until the first target
    // evaluates scripts. Throws SpawnError, ProcessNotRunning or
    // retry::OutOfRetriesError; the process is killed if waiting fails.
    static std::unique_ptr<ChromeDriver> spawn(const browser_driver::DriverOptions &options);

    ChromeDriver(browser_driver::ProcessHandle process, int port);

    bool is_alive() override;
    void kill() override;
    int port() const override { return port_; }

    // Throws driver_errors::ProcessNotRunning if Chrome has exited.
    void check_is_alive();

    std::vector<browser_driver::DebugTarget> list_targets() override;
    std::unique_ptr<DebugChannel> open_channel(std::size_t index = 0) override;

    // Polls discovery until at least one target is listed, then waits until
    // target 0 evaluates document.body.innerText without a script error.
    void wait_until_ready(const retry::RetryPolicy &policy);

private:
    browser_driver::ProcessHandle process_;
    int port_;
};

// Converts the discovery response. Entries without a webSocketDebuggerUrl
// (targets already attached elsewhere) are skipped.
// Throws driver_errors::UnknownProtocolResult if pages is not an array.
std::vector<browser_driver::DebugTarget> parse_target_list(const json &pages);

} // namespace cdp_driver

#endif // CDPDRIVE_CHROME_DRIVER_HPP
