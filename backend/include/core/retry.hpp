#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace candlecast::core {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for_ms(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

struct RetryPolicy {
    uint32_t max_attempts = 3;
    uint64_t base_delay_ms = 1000;
    uint64_t max_delay_ms = 60000;
};

// Timeouts, refused or reset connections, gateway errors and rate limiting.
bool is_transient_error(const Error& error);

inline std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt) {
    uint64_t delay = policy.base_delay_ms;
    for (uint32_t i = 0; i < attempt && delay < policy.max_delay_ms; ++i) {
        delay *= 2;
    }
    if (delay > policy.max_delay_ms) delay = policy.max_delay_ms;
    return std::chrono::milliseconds(delay);
}

/**
 * @brief Run op until it succeeds, fails permanently, or attempts run out.
 * op returns Expected<T> or Status; only transient errors are retried.
 */
template <typename Op>
auto retry_with_backoff(const RetryPolicy& policy, Op&& op, const Sleeper& sleeper = sleep_for_ms)
    -> decltype(op()) {
    uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
    for (uint32_t attempt = 0;; ++attempt) {
        auto result = op();
        if (result) return result;
        if (attempt + 1 >= attempts || !is_transient_error(result.error_info())) {
            return result;
        }
        sleeper(backoff_delay(policy, attempt));
    }
}

} // namespace candlecast::core
