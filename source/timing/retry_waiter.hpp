#ifndef CDPDRIVE_RETRY_WAITER_HPP
#define CDPDRIVE_RETRY_WAITER_HPP

// Bounded retry combinator.
//
// A RetryWaiter repeatedly runs an action through a success predicate until
// the predicate reports success or the attempt budget runs out. Predicates
// report each attempt as a tagged Attempt<T>:
//   Success(value)  - stop, return value
//   Retry(message)  - sleep, try again (message is only logged)
//   Fatal(error)    - stop, rethrow error
//
// Example:
//   retry::RetryWaiter waiter({5, std::chrono::milliseconds(1000)});
//   std::string text = waiter.until_no_exception<driver_errors::JsExecutionError>(
//       [&] { return channel.run_js_get_value(script).get<std::string>(); });

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace retry {

// Retry diagnostics are capped at this many characters.
constexpr std::size_t kMaxDiagnosticLength = 200;

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{500};
};

// Thrown by RetryWaiter when every attempt asked for a retry.
class OutOfRetriesError : public std::runtime_error {
public:
    OutOfRetriesError(int attempts, const std::string &last_diagnostic);

    int attempts() const { return attempts_; }
    const std::string &last_diagnostic() const { return last_diagnostic_; }

private:
    int attempts_;
    std::string last_diagnostic_;
};

namespace detail {

std::string cap_diagnostic(const std::string &diagnostic);
void log_retry(int attempt, int max_attempts, const std::string &diagnostic);

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
    : std::true_type {};

template <typename T>
std::string describe(const T &value) {
    if constexpr (is_streamable<T>::value) {
        std::ostringstream stream;
        stream << std::boolalpha << value;
        return stream.str();
    } else {
        return "<unprintable value>";
    }
}

} // namespace detail

// Outcome of one attempt.
template <typename T>
class Attempt {
    static_assert(!std::is_void<T>::value && !std::is_reference<T>::value,
                  "Attempt<T> needs an object type");

public:
    using value_type = T;

    static Attempt success(T value) {
        return Attempt(Outcome(std::in_place_index<0>, std::move(value)));
    }

    // diagnostic is capped; context is prepended after capping.
    static Attempt retry(const std::string &diagnostic, const std::string &context = std::string()) {
        return Attempt(Outcome(std::in_place_index<1>, RetrySignal{context + detail::cap_diagnostic(diagnostic)}));
    }

    static Attempt fatal(std::exception_ptr error) {
        return Attempt(Outcome(std::in_place_index<2>, std::move(error)));
    }

    bool is_success() const { return outcome_.index() == 0; }
    bool is_retry() const { return outcome_.index() == 1; }
    bool is_fatal() const { return outcome_.index() == 2; }

    T take_value() { return std::move(std::get<0>(outcome_)); }
    const std::string &diagnostic() const { return std::get<1>(outcome_).diagnostic; }
    std::exception_ptr error() const { return std::get<2>(outcome_); }

private:
    struct RetrySignal {
        std::string diagnostic;
    };
    using Outcome = std::variant<T, RetrySignal, std::exception_ptr>;

    explicit Attempt(Outcome outcome) : outcome_(std::move(outcome)) {}

    Outcome outcome_;
};

class RetryWaiter {
public:
    RetryWaiter();

    // Throws std::invalid_argument for max_attempts < 1 or a negative delay.
    explicit RetryWaiter(RetryPolicy policy);

    const RetryPolicy &policy() const { return policy_; }

    // Runs success_predicate(action, args...) until it returns a Success or
    // Fatal outcome. Exceptions thrown by the predicate are not retried.
    template <typename Predicate, typename Action, typename... Args>
    auto until(Predicate &&success_predicate, Action &&action, Args &&...args)
        -> typename std::invoke_result_t<Predicate &, Action &, Args &...>::value_type {
        using AttemptType = std::invoke_result_t<Predicate &, Action &, Args &...>;

        std::string last_diagnostic;
        for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
            AttemptType outcome = std::invoke(success_predicate, action, args...);
            if (outcome.is_success()) {
                return outcome.take_value();
            }
            if (outcome.is_fatal()) {
                std::rethrow_exception(outcome.error());
            }
            last_diagnostic = outcome.diagnostic();
            detail::log_retry(attempt, policy_.max_attempts, last_diagnostic);
            if (attempt < policy_.max_attempts) {
                sleep_between_attempts();
            }
        }
        throw OutOfRetriesError(policy_.max_attempts, last_diagnostic);
    }

    // Retries until value_predicate(action(args...)) holds; returns that value.
    template <typename ValuePredicate, typename Action, typename... Args>
    auto until_value(ValuePredicate &&value_predicate, Action &&action, Args &&...args)
        -> std::decay_t<std::invoke_result_t<Action &, Args &...>> {
        using Value = std::decay_t<std::invoke_result_t<Action &, Args &...>>;

        auto check_value = [&value_predicate](auto &callable, auto &...call_args) -> Attempt<Value> {
            Value result = std::invoke(callable, call_args...);
            if (std::invoke(value_predicate, static_cast<const Value &>(result))) {
                return Attempt<Value>::success(std::move(result));
            }
            return Attempt<Value>::retry(detail::describe(result),
                                         "Return value (capped at 200 characters): ");
        };
        return until(check_value, action, args...);
    }

    // Retries until action(args...) returns something truthy.
    template <typename Action, typename... Args>
    auto until_true(Action &&action, Args &&...args)
        -> std::decay_t<std::invoke_result_t<Action &, Args &...>> {
        return until_value([](const auto &value) { return static_cast<bool>(value); },
                           action, args...);
    }

    // Retries while action(args...) throws ErrorType; other exceptions propagate.
    template <typename ErrorType, typename Action, typename... Args>
    auto until_no_exception(Action &&action, Args &&...args)
        -> std::decay_t<std::invoke_result_t<Action &, Args &...>> {
        using Value = std::decay_t<std::invoke_result_t<Action &, Args &...>>;

        auto check_exception = [](auto &callable, auto &...call_args) -> Attempt<Value> {
            try {
                return Attempt<Value>::success(std::invoke(callable, call_args...));
            } catch (const ErrorType &error) {
                return Attempt<Value>::retry(error.what());
            }
        };
        return until(check_exception, action, args...);
    }

private:
    void sleep_between_attempts() const;

    RetryPolicy policy_;
};

} // namespace retry

#endif // CDPDRIVE_RETRY_WAITER_HPP
