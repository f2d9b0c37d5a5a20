//===== retry_policy.hpp =====
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include "bar_catalog/core/error.hpp"
#include "bar_catalog/core/logger.hpp"

namespace bar_catalog {

/**
 * @brief Bounded exponential backoff around a Result-returning operation
 *
 * Attempt n (1-based) that fails with a retryable error is followed by a wait
 * of base_delay * multiplier^(n-1), capped at max_delay and never shorter
 * than a retry-after hint carried by the error. Fatal errors are returned at
 * once without consuming further attempts.
 */
struct RetryPolicy {
    size_t max_attempts{3};
    std::chrono::milliseconds base_delay{2000};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{60000};

    /**
     * @brief Timeouts, dropped connections and quota rejections are transient
     */
    static bool is_retryable(ErrorCode code) {
        return code == ErrorCode::TIMEOUT_ERROR || code == ErrorCode::CONNECTION_ERROR ||
               code == ErrorCode::RATE_LIMIT_EXCEEDED;
    }

    std::chrono::milliseconds delay_for_attempt(size_t attempt) const {
        double delay_ms = static_cast<double>(base_delay.count());
        for (size_t i = 1; i < attempt; ++i) {
            delay_ms *= multiplier;
            if (delay_ms >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        return std::min(max_delay,
                        std::chrono::milliseconds(static_cast<int64_t>(delay_ms)));
    }

    /**
     * @brief Run func(attempt) until it succeeds, fails fatally or runs out of attempts
     * @param func Callable taking the 1-based attempt number and returning Result<T>
     * @return The first success, the first fatal error, or the last retryable error
     */
    template <typename Func>
    auto execute(Func&& func) const -> decltype(func(size_t{1})) {
        const size_t attempts = std::max<size_t>(1, max_attempts);

        for (size_t attempt = 1;; ++attempt) {
            auto result = func(attempt);
            if (result.is_ok() || !is_retryable(result.error()->code()) || attempt >= attempts) {
                return result;
            }

            auto delay = delay_for_attempt(attempt);
            if (const auto& hint = result.error()->retry_after()) {
                delay = std::max(delay, *hint);
            }

            WARN("Attempt " << attempt << " of " << attempts << " failed ("
                            << error_code_to_string(result.error()->code())
                            << "): " << result.error()->what() << ", retrying in "
                            << delay.count() << "ms");

            std::this_thread::sleep_for(delay);
        }
    }
};

}  // namespace bar_catalog
