#include "atx/transfer/retry.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace atx::transfer {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::chrono::milliseconds backoff_delay(const core::RetryPolicy& policy,
                                        std::uint32_t attempt,
                                        std::mt19937& rng) {
    const double base = static_cast<double>(policy.base_delay.count());
    const double cap = static_cast<double>(policy.max_delay.count());
    double delay = std::min(base * std::pow(policy.multiplier, static_cast<double>(attempt)), cap);
    if (policy.jitter && delay > 0.0) {
        std::uniform_real_distribution<double> factor(0.5, 1.0);
        delay *= factor(rng);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(delay, 0.0)));
}

std::chrono::milliseconds backoff_delay(const core::RetryPolicy& policy, std::uint32_t attempt) {
    thread_local std::mt19937 rng{std::random_device{}()};
    return backoff_delay(policy, attempt, rng);
}

} // namespace atx::transfer
