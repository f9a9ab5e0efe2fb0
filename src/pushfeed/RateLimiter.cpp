#include "pushfeed/RateLimiter.hpp"

#include <algorithm>

namespace pushfeed {
    RateLimiter::RateLimiter(std::size_t limit, clock::duration window)
        : limit_(std::max<std::size_t>(limit, 1)),
          window_(window) {
    }

    void RateLimiter::prune_(clock::time_point now) {
        while (!sent_.empty() && now - sent_.front() >= window_) {
            sent_.pop_front();
        }
    }

    RateLimiter::clock::duration RateLimiter::tryAcquire(clock::time_point now) {
        prune_(now);

        if (sent_.size() < limit_) {
            sent_.push_back(now);
            return clock::duration::zero();
        }

        // Full window: wait until the oldest send leaves it.
        return (sent_.front() + window_) - now;
    }

    std::size_t RateLimiter::inWindow(clock::time_point now) const {
        return static_cast<std::size_t>(std::count_if(sent_.begin(), sent_.end(),
                                                      [&](clock::time_point t) { return now - t < window_; }));
    }
} // namespace pushfeed
