#ifndef CDPDRIVE_BROWSER_DRIVER_ABI_HPP
#define CDPDRIVE_BROWSER_DRIVER_ABI_HPP

// Browser driver abstraction interface.
// A driver owns one running browser and hands out debug channels to its
// targets. cdp_driver::ChromeDriver is the Chrome implementation; the
// DriverManager and the command service only see this interface.

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "browser/cdp/debug_channel.hpp"
#include "timing/retry_waiter.hpp"

namespace browser_driver {

// One tab / target as listed by the discovery endpoint.
struct DebugTarget {
    std::string id;
    std::string type; // e.g. "page", "background_page", "service_worker"
    std::string title;
    std::string url;
    std::string websocket_url;
};

// Settings for spawning and supervising a browser.
struct DriverOptions {
    int port = 9222;
    bool headless = false;
    // Best-effort SIGKILL of stale browser processes before spawning.
    bool kill_existing_instances = true;
    // Block in spawn until the browser evaluates scripts.
    bool wait_until_ready = true;
    retry::RetryPolicy readiness_policy{10, std::chrono::milliseconds(1000)};
    // Kill the driver when an action run through the manager throws.
    bool recycle_on_failure = true;
    // Empty: search the well-known install locations.
    std::string chrome_executable;
    // Empty: a fresh per-process profile under /tmp.
    std::string user_data_directory;
    // Matched against /proc/<pid>/comm by the stale-instance cleanup.
    std::vector<std::string> stale_process_names = {"chrome", "chromium"};
    std::vector<std::string> extra_arguments;
};

class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    virtual bool is_alive() = 0;

    // Forceful termination; no-op when already dead.
    virtual void kill() = 0;

    virtual int port() const = 0;

    virtual std::vector<DebugTarget> list_targets() = 0;

    // Throws driver_errors::TargetNotFound if there is no target at index.
    virtual std::unique_ptr<cdp_driver::DebugChannel> open_channel(std::size_t index = 0) = 0;
};

} // namespace browser_driver

#endif // CDPDRIVE_BROWSER_DRIVER_ABI_HPP
