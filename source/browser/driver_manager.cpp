#include "browser/driver_manager.hpp"
#include "browser/cdp/chrome_driver.hpp"
#include "utils/debug_log.hpp"

namespace browser_driver {

static std::unique_ptr<BrowserDriver> spawn_chrome_driver(const DriverOptions &options) {
    return cdp_driver::ChromeDriver::spawn(options);
}

DriverManager::DriverManager(DriverOptions options)
    : DriverManager(std::move(options), spawn_chrome_driver) {}

DriverManager::DriverManager(DriverOptions options, DriverFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)), port_lease_(options_.port) {}

DriverManager::~DriverManager() {
    // Destroyed from inside an action: this thread already holds the lock.
    if (running_thread_.load() == std::this_thread::get_id()) {
        quit_locked();
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    quit_locked();
}

DriverManager::ScopedRun::ScopedRun(DriverManager &manager) : manager_(manager) {
    if (manager_.running_thread_.load() == std::this_thread::get_id()) {
        throw driver_errors::DriverError("DriverManager::run called from inside a running action");
    }
    lock_ = std::unique_lock<std::mutex>(manager_.mutex_);
    manager_.running_thread_.store(std::this_thread::get_id());
}

DriverManager::ScopedRun::~ScopedRun() {
    manager_.running_thread_.store(std::thread::id());
}

void DriverManager::quit() {
    if (running_thread_.load() == std::this_thread::get_id()) {
        throw driver_errors::DriverError("DriverManager::quit called from inside a running action");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    quit_locked();
}

bool DriverManager::has_driver() {
    std::lock_guard<std::mutex> lock(mutex_);
    return driver_ != nullptr;
}

BrowserDriver &DriverManager::get_or_create_driver() {
    if (driver_ && driver_->is_alive()) {
        return *driver_;
    }

    if (driver_) {
        // Whatever the crash left behind in the process group goes too.
        debug_log::notice("Browser on port " + std::to_string(options_.port) + " is gone; starting a new one.");
        driver_->kill();
        driver_.reset();
    }

    driver_ = factory_(options_);
    if (!driver_) {
        throw driver_errors::SpawnError("Driver factory returned no driver for port " +
                                        std::to_string(options_.port));
    }
    return *driver_;
}

void DriverManager::quit_locked() {
    if (!driver_) {
        return;
    }
    if (driver_->is_alive()) {
        driver_->kill();
    }
    driver_.reset();
}

void DriverManager::handle_action_failure() {
    if (!driver_) {
        return;
    }
    if (options_.recycle_on_failure) {
        debug_log::log("Action failed; discarding browser on port " + std::to_string(options_.port));
        quit_locked();
    } else if (!driver_->is_alive()) {
        quit_locked();
    }
}

} // namespace browser_driver
