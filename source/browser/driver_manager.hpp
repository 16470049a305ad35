#ifndef CDPDRIVE_DRIVER_MANAGER_HPP
#define CDPDRIVE_DRIVER_MANAGER_HPP

// Supervises the browser bound to one fixed debugging port.
//
// The manager lazily spawns a driver, reuses it while it reports alive and
// transparently replaces it after a crash. Wrap the work into an action that
// starts by setting the state it needs (e.g. loading a URL): any call may run
// against a brand-new browser, so actions must not assume session state
// survives between calls.
//
// run() and quit() are serialized; concurrent callers queue on the manager.
// run() is not reentrant: calling it from inside an action throws.

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

#include "browser/browser_driver_abi.hpp"
#include "browser/driver_errors.hpp"
#include "browser/port_lease.hpp"
#include "timing/retry_waiter.hpp"

namespace browser_driver {

class DriverManager {
public:
    using DriverFactory = std::function<std::unique_ptr<BrowserDriver>(const DriverOptions &)>;

    // Default policy of run_with_recovery().
    static constexpr int kRecoveryAttempts = 3;
    static constexpr int kRecoveryDelayMilliseconds = 500;

    // Spawns cdp_driver::ChromeDriver instances.
    explicit DriverManager(DriverOptions options = DriverOptions());

    // Throws driver_errors::PortInUse if another manager owns options.port.
    DriverManager(DriverOptions options, DriverFactory factory);

    ~DriverManager();

    DriverManager(const DriverManager &) = delete;
    DriverManager &operator=(const DriverManager &) = delete;

    // Runs action(driver) against a live driver, spawning one if needed.
    // Exceptions from the action are rethrown unchanged after cleanup.
    template <typename Action>
    auto run(Action &&action, bool close_upon_completion = false)
        -> std::invoke_result_t<Action &, BrowserDriver &> {
        static_assert(std::is_invocable<Action &, BrowserDriver &>::value,
                      "DriverManager::run needs a callable taking BrowserDriver &");
        using Result = std::invoke_result_t<Action &, BrowserDriver &>;

        ScopedRun scoped_run(*this);
        BrowserDriver &driver = get_or_create_driver();
        try {
            if constexpr (std::is_void<Result>::value) {
                std::invoke(action, driver);
                if (close_upon_completion) {
                    quit_locked();
                }
            } else {
                Result result = std::invoke(action, driver);
                if (close_upon_completion) {
                    quit_locked();
                }
                return result;
            }
        } catch (...) {
            handle_action_failure();
            throw;
        }
    }

    // run(), retried on a fresh browser while it fails with
    // driver_errors::BrowserUnavailable (crash, dropped connection).
    template <typename Action>
    auto run_with_recovery(Action &&action,
                           retry::RetryPolicy policy = {kRecoveryAttempts,
                                                        std::chrono::milliseconds(kRecoveryDelayMilliseconds)},
                           bool close_upon_completion = false)
        -> std::decay_t<std::invoke_result_t<Action &, BrowserDriver &>> {
        static_assert(!std::is_void<std::invoke_result_t<Action &, BrowserDriver &>>::value,
                      "run_with_recovery needs an action that returns a value");
        return retry::RetryWaiter(policy).until_no_exception<driver_errors::BrowserUnavailable>(
            [this, &action, close_upon_completion] { return run(action, close_upon_completion); });
    }

    // Kills the driver if it is alive and returns to the no-driver state. Idempotent.
    void quit();

    bool has_driver();

    const DriverOptions &options() const { return options_; }

private:
    // Holds the manager lock for one run(); refuses reentrant calls.
    class ScopedRun {
    public:
        explicit ScopedRun(DriverManager &manager);
        ~ScopedRun();

        ScopedRun(const ScopedRun &) = delete;
        ScopedRun &operator=(const ScopedRun &) = delete;

    private:
        DriverManager &manager_;
        std::unique_lock<std::mutex> lock_;
    };

    BrowserDriver &get_or_create_driver();
    void quit_locked();
    void handle_action_failure();

    DriverOptions options_;
    DriverFactory factory_;
    PortLease port_lease_;
    std::unique_ptr<BrowserDriver> driver_;
    std::mutex mutex_;
    std::atomic<std::thread::id> running_thread_{};
};

} // namespace browser_driver

#endif // CDPDRIVE_DRIVER_MANAGER_HPP
