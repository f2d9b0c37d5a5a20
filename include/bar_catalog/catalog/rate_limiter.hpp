//===== rate_limiter.hpp =====
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace bar_catalog {

/**
 * @brief Sliding-window throttle for outbound provider requests
 *
 * At most floor(requests_per_window * safety_fraction) requests (never less
 * than one) are admitted within any window. One instance is shared by every
 * fetch of the process.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(size_t requests_per_window,
                         std::chrono::milliseconds window = std::chrono::seconds(1),
                         double safety_fraction = 0.9);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Block until a slot is free, then take it
     */
    void acquire();

    /**
     * @brief Take a slot only if one is free right now
     * @return true if the slot was taken
     */
    bool try_acquire();

    /**
     * @brief Number of slots taken within the current window
     */
    size_t in_window() const;

    size_t capacity() const {
        return capacity_;
    }

    std::chrono::milliseconds window() const {
        return window_;
    }

private:
    // Caller holds mutex_
    void evict_expired(Clock::time_point now) const;

    size_t capacity_;
    std::chrono::milliseconds window_;
    mutable std::mutex mutex_;
    mutable std::deque<Clock::time_point> requests_;
};

}  // namespace bar_catalog
