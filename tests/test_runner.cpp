// Test runner: runs every suite and reports results.
// No browser is started; drivers and debug connections are faked.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>
#include <stdexcept>

// Forward declarations of test functions from other test files.
namespace test_retry_waiter { bool run_all_tests(); }
namespace test_utf8_text { bool run_all_tests(); }
namespace test_process_handle { bool run_all_tests(); }
namespace test_debug_channel { bool run_all_tests(); }
namespace test_chrome_launch { bool run_all_tests(); }
namespace test_chrome_driver { bool run_all_tests(); }
namespace test_driver_manager { bool run_all_tests(); }
namespace test_ui_actions { bool run_all_tests(); }
namespace test_config { bool run_all_tests(); }
namespace test_service { bool run_all_tests(); }

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main(int argc, char **argv) {
    std::vector<TestSuite> suites = {
        {"test_retry_waiter", test_retry_waiter::run_all_tests},
        {"test_utf8_text", test_utf8_text::run_all_tests},
        {"test_process_handle", test_process_handle::run_all_tests},
        {"test_debug_channel", test_debug_channel::run_all_tests},
        {"test_chrome_launch", test_chrome_launch::run_all_tests},
        {"test_chrome_driver", test_chrome_driver::run_all_tests},
        {"test_driver_manager", test_driver_manager::run_all_tests},
        {"test_ui_actions", test_ui_actions::run_all_tests},
        {"test_config", test_config::run_all_tests},
        {"test_service", test_service::run_all_tests},
    };

    // Optional suite name filter: cdpdrive_tests test_driver_manager
    std::string only_suite = argc > 1 ? argv[1] : "";

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== cdpdrive Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        if (!only_suite.empty() && suite.name != only_suite) {
            continue;
        }
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = false;
        try {
            suite_passed = suite.runner();
        } catch (const std::exception &error) {
            std::cout << "  FAIL: uncaught exception: " << error.what() << std::endl;
        }

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0 && passed_count > 0) ? 0 : 1;
}
