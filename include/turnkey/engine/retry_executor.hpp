#pragma once

#include "../types.hpp"
#include "../config.hpp"
#include "../log.hpp"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace turnkey {
namespace engine {

/// Suspends the caller; injectable so tests can observe delays without waiting.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper default_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

namespace detail {

template<typename T>
struct is_expected : std::false_type {};

template<typename T>
struct is_expected<Expected<T>> : std::true_type {};

} // namespace detail

/**
 * @brief Bounded retry with exponential backoff and no jitter
 *
 * Two exhaustion policies, as separate entry points:
 * - run() propagates the last error once every attempt has failed
 * - run_or() returns a caller-supplied fallback instead
 *
 * Operations are nullary callables returning Expected<T>. An exception thrown
 * by the operation counts as a failed attempt.
 */
class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy = {}, Sleeper sleeper = default_sleeper())
        : policy_(policy)
        , sleeper_(std::move(sleeper))
    {}

    const RetryPolicy& policy() const { return policy_; }

    /**
     * @brief Run an operation until it succeeds or attempts are exhausted
     *
     * @param name Operation name used in log lines
     * @param op Callable returning Expected<T>
     * @return The first successful value, or the error of the final attempt
     */
    template<typename Op>
    auto run(const std::string& name, Op&& op) const -> std::invoke_result_t<Op&> {
        using Result = std::invoke_result_t<Op&>;
        static_assert(detail::is_expected<Result>::value, "Retried operations must return Expected<T>");

        const int max_attempts = policy_.max_attempts > 0 ? policy_.max_attempts : 1;
        for (int attempt = 1; ; ++attempt) {
            Result result = invoke_guarded<Result>(op);
            if (result) {
                return result;
            }
            if (attempt >= max_attempts) {
                log::logger()->error("{} failed after {} attempt(s): {}",
                                     name, attempt, result.error().to_string());
                return result;
            }

            const auto delay = policy_.delay_before(attempt + 1);
            log::logger()->warn("[Retry {}/{}] {} failed: {}", attempt, max_attempts, name, result.error().message);
            log::logger()->warn("Waiting {}ms before retry...", delay.count());
            sleeper_(delay);
        }
    }

    /**
     * @brief Run an operation, returning a fallback value on exhaustion
     *
     * @param name Operation name used in log lines
     * @param op Callable returning Expected<T>
     * @param fallback Returned when the final attempt fails
     */
    template<typename Op, typename T>
    T run_or(const std::string& name, Op&& op, T fallback) const {
        auto result = run(name, std::forward<Op>(op));
        if (!result) {
            return fallback;
        }
        return std::move(*result);
    }

private:
    template<typename Result, typename Op>
    static Result invoke_guarded(Op& op) {
        try {
            return op();
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::Unknown, e.what()});
        }
    }

    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace engine
} // namespace turnkey
