#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace webhunter {

// Waits for the given delay; returns false when the wait was cut short by shutdown
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 2.0;

    // Delay before the attempt following the given (1-based) failed attempt.
    // Non-decreasing in `attempt` and never above max_delay.
    std::chrono::milliseconds delay_after(int attempt) const;
};

template<typename T>
struct RetryResult {
    T value;
    int attempts;
    bool cancelled;
    std::vector<std::chrono::milliseconds> delays;
};

// Runs `op(attempt)` until `should_retry(result)` is false, the attempt
// ceiling is reached, or the sleeper reports cancellation. The last result
// is always returned.
template<typename Op, typename ShouldRetry>
auto retry(const RetryPolicy& policy, const Sleeper& sleep, Op&& op, ShouldRetry&& should_retry)
    -> RetryResult<std::invoke_result_t<Op&, int>> {
    using T = std::invoke_result_t<Op&, int>;

    const int max_attempts = std::max(1, policy.max_attempts);
    std::vector<std::chrono::milliseconds> delays;

    for (int attempt = 1;; ++attempt) {
        T value = op(attempt);
        if (attempt >= max_attempts || !should_retry(value)) {
            return RetryResult<T>{std::move(value), attempt, false, std::move(delays)};
        }

        auto delay = policy.delay_after(attempt);
        delays.push_back(delay);
        if (!sleep(delay)) {
            return RetryResult<T>{std::move(value), attempt, true, std::move(delays)};
        }
    }
}

} // namespace webhunter
