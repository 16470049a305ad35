#include "timing/retry_waiter.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_text.hpp"

#include <thread>

namespace retry {

OutOfRetriesError::OutOfRetriesError(int attempts, const std::string &last_diagnostic)
    : std::runtime_error("Action did not succeed after " + std::to_string(attempts) + " retries." +
                         (last_diagnostic.empty() ? std::string() : " Last error: " + last_diagnostic)),
      attempts_(attempts),
      last_diagnostic_(last_diagnostic) {}

namespace detail {

std::string cap_diagnostic(const std::string &diagnostic) {
    return utf8_text::truncate(diagnostic, kMaxDiagnosticLength);
}

void log_retry(int attempt, int max_attempts, const std::string &diagnostic) {
    debug_log::log("Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                   " will retry if allowed; current error: " + diagnostic);
}

} // namespace detail

RetryWaiter::RetryWaiter() : RetryWaiter(RetryPolicy{}) {}

RetryWaiter::RetryWaiter(RetryPolicy policy) : policy_(policy) {
    if (policy_.max_attempts < 1) {
        throw std::invalid_argument("RetryPolicy.max_attempts must be at least 1, got " +
                                    std::to_string(policy_.max_attempts));
    }
    if (policy_.delay.count() < 0) {
        throw std::invalid_argument("RetryPolicy.delay must not be negative");
    }
}

void RetryWaiter::sleep_between_attempts() const {
    if (policy_.delay.count() > 0) {
        std::this_thread::sleep_for(policy_.delay);
    }
}

} // namespace retry
