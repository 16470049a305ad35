// Tests for cdp_driver::ChromeDriver lifecycle paths that need no browser:
// readiness waiting against a stand-in process, and the stale-instance sweep.

#include "browser/cdp/chrome_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/driver_errors.hpp"
#include "browser/process_handle.hpp"
#include "platform/platform_abi.hpp"
#include "helpers/proc_status.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace test_chrome_driver {

using browser_driver::ProcessHandle;

// Nothing listens here, so discovery fails with a connection error.
static constexpr int kClosedPort = 1;

static const retry::RetryPolicy kTwoQuickAttempts{2, std::chrono::milliseconds(0)};

static bool report(bool passed, const std::string &description) {
    std::cout << (passed ? "  OK: " : "  FAIL: ") << description << std::endl;
    return passed;
}

// Test: a live process whose port never answers exhausts the readiness policy.
static bool test_wait_until_ready_times_out() {
    cdp_driver::ChromeDriver driver(ProcessHandle::spawn("/bin/sleep", {"30"}), kClosedPort);
    try {
        driver.wait_until_ready(kTwoQuickAttempts);
    } catch (const retry::OutOfRetriesError &error) {
        bool still_alive = driver.is_alive();
        driver.kill();
        return report(error.attempts() == 2 && still_alive && !driver.is_alive(),
                      "Unreachable discovery endpoint is retried until OutOfRetriesError");
    }
    return report(false, "wait_until_ready returned against a closed port");
}

// Test: a process that already exited stops the wait at once.
static bool test_wait_until_ready_dead_process() {
    ProcessHandle process = ProcessHandle::spawn("/bin/sleep", {"0"});
    platform::wait_for_exit(process.pid(), 5000);
    cdp_driver::ChromeDriver driver(std::move(process), kClosedPort);

    bool fatal = false;
    try {
        driver.wait_until_ready(retry::RetryPolicy{5, std::chrono::milliseconds(1000)});
    } catch (const driver_errors::ProcessNotRunning &) {
        fatal = true;
    }
    bool listing_refused = false;
    try {
        driver.list_targets();
    } catch (const driver_errors::ProcessNotRunning &) {
        listing_refused = true;
    }
    return report(fatal && listing_refused,
                  "Exited process makes wait_until_ready and list_targets throw ProcessNotRunning");
}

// Test: the stale sweep kills a matching stranger but spares our own child.
static bool test_kill_stale_instances_spares_own_children() {
    // A uniquely named copy of sleep, so the sweep cannot touch anything else.
    const std::string stale_binary = "/tmp/cdpstale_test";
    std::error_code copy_error;
    std::filesystem::copy_file("/bin/sleep", stale_binary, std::filesystem::copy_options::overwrite_existing,
                               copy_error);
    if (copy_error) {
        return report(false, "Could not copy /bin/sleep to " + stale_binary + ": " + copy_error.message());
    }
    std::filesystem::permissions(stale_binary, std::filesystem::perms::owner_all, copy_error);

    ProcessHandle own_child = ProcessHandle::spawn(stale_binary, {"300"});
    // The shell exits at once, leaving its background child to init.
    ProcessHandle shell = ProcessHandle::spawn("/bin/sh", {"-c", stale_binary + " 300 & exit 0"});
    platform::wait_for_exit(shell.pid(), 5000);

    int stranger = -1;
    test_helpers::eventually([&] {
        for (int process_id : platform::find_processes_by_name("cdpstale_test")) {
            if (process_id != own_child.pid()) {
                stranger = process_id;
            }
        }
        return stranger > 0;
    });
    if (stranger <= 0) {
        return report(false, "Background copy of the stale binary never appeared");
    }

    int killed = cdp_chrome_launch::kill_stale_instances({"cdpstale_test"});
    bool stranger_gone = test_helpers::eventually([stranger] { return !test_helpers::is_running(stranger); });
    bool own_alive = own_child.is_alive();

    own_child.kill();
    std::filesystem::remove(stale_binary, copy_error);
    return report(killed == 1 && stranger_gone && own_alive,
                  "kill_stale_instances kills the orphaned match and keeps the spawned child");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_wait_until_ready_times_out();
    all_passed &= test_wait_until_ready_dead_process();
    all_passed &= test_kill_stale_instances_spares_own_children();
    return all_passed;
}

} // namespace test_chrome_driver
