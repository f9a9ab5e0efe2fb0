#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace pushfeed {
    /**
     * Trailing-window limiter for control frames (subscribe/unsubscribe/auth).
     *
     * Keeps the send timestamps of the last `limit` frames. A frame may go out at `now`
     * only if fewer than `limit` sends happened in [now - window, now). Heartbeats do not
     * go through here.
     */
    class RateLimiter {
    public:
        using clock = std::chrono::steady_clock;

        explicit RateLimiter(std::size_t limit, clock::duration window = std::chrono::seconds(1));

        /**
         * Try to take a slot at `now`.
         * @return zero if the slot was taken (the send is recorded at `now`),
         *         otherwise how long to wait before trying again. Nothing is recorded then.
         */
        clock::duration tryAcquire(clock::time_point now);

        /// Number of sends still inside the window at `now`.
        [[nodiscard]] std::size_t inWindow(clock::time_point now) const;

        [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
        [[nodiscard]] clock::duration window() const noexcept { return window_; }

        void reset() { sent_.clear(); }

    private:
        void prune_(clock::time_point now);

        std::size_t limit_;
        clock::duration window_;
        std::deque<clock::time_point> sent_;
    };
} // namespace pushfeed
