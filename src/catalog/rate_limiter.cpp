//===== rate_limiter.cpp =====

#include "bar_catalog/catalog/rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include "bar_catalog/core/logger.hpp"

namespace bar_catalog {

RateLimiter::RateLimiter(size_t requests_per_window, std::chrono::milliseconds window,
                         double safety_fraction)
    : window_(window) {
    const double fraction = std::clamp(safety_fraction, 0.0, 1.0);
    // The epsilon absorbs binary rounding, e.g. 50 * 0.9
    const auto allowed =
        static_cast<size_t>(std::floor(static_cast<double>(requests_per_window) * fraction + 1e-9));
    capacity_ = std::max<size_t>(1, allowed);
}

void RateLimiter::evict_expired(Clock::time_point now) const {
    while (!requests_.empty() && requests_.front() + window_ <= now) {
        requests_.pop_front();
    }
}

void RateLimiter::acquire() {
    while (true) {
        Clock::duration wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = Clock::now();
            evict_expired(now);
            if (requests_.size() < capacity_) {
                requests_.push_back(now);
                return;
            }
            wait = requests_.front() + window_ - now;
        }
        TRACE("Rate limit reached, waiting "
              << std::chrono::duration_cast<std::chrono::milliseconds>(wait).count() << "ms");
        std::this_thread::sleep_for(wait);
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    evict_expired(now);
    if (requests_.size() < capacity_) {
        requests_.push_back(now);
        return true;
    }
    return false;
}

size_t RateLimiter::in_window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired(Clock::now());
    return requests_.size();
}

}  // namespace bar_catalog
