#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <utility>

namespace atx::transfer {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeps on the calling thread.
Sleeper thread_sleeper();

/**
 * @brief Delay before retry number attempt (0-based)
 *
 * min(base_delay * multiplier^attempt, max_delay); with jitter the result is
 * scaled by a uniform factor in [0.5, 1.0].
 */
std::chrono::milliseconds backoff_delay(const core::RetryPolicy& policy,
                                        std::uint32_t attempt,
                                        std::mt19937& rng);

/// Same as above with a per-thread generator.
std::chrono::milliseconds backoff_delay(const core::RetryPolicy& policy, std::uint32_t attempt);

/**
 * @brief Runs op until it succeeds or max_retries + 1 attempts are spent
 *
 * op receives the 0-based attempt number and returns a Result. Between
 * failed attempts on_retry(attempt, error, delay) is invoked and then
 * sleeper(delay). No sleep follows the final attempt. Returns the first
 * success or the last error.
 */
template<typename Op, typename OnRetry>
auto retry_with_backoff(const core::RetryPolicy& policy,
                        Op&& op,
                        const Sleeper& sleeper,
                        OnRetry&& on_retry) -> decltype(op(std::uint32_t{0})) {
    const std::uint32_t attempts = policy.max_retries + 1;
    for (std::uint32_t attempt = 0;; ++attempt) {
        auto result = op(attempt);
        if (result.is_ok() || attempt + 1 >= attempts) {
            return result;
        }
        const auto delay = backoff_delay(policy, attempt);
        on_retry(attempt, result.error(), delay);
        if (delay.count() > 0) {
            sleeper(delay);
        }
    }
}

template<typename Op>
auto retry_with_backoff(const core::RetryPolicy& policy, Op&& op, const Sleeper& sleeper)
    -> decltype(op(std::uint32_t{0})) {
    return retry_with_backoff(policy, std::forward<Op>(op), sleeper,
                              [](std::uint32_t, const Error&, std::chrono::milliseconds) {});
}

} // namespace atx::transfer
