#include <gtest/gtest.h>

#include <vector>

#include "pushfeed/RateLimiter.hpp"

using pushfeed::RateLimiter;
using namespace std::chrono_literals;

namespace {
    // Sends `n` frames as early as the limiter allows, returns their send times relative to t0.
    std::vector<RateLimiter::clock::duration> drain(RateLimiter &limiter, int n, RateLimiter::clock::time_point t0) {
        std::vector<RateLimiter::clock::duration> at;
        auto now = t0;
        while (static_cast<int>(at.size()) < n) {
            const auto wait = limiter.tryAcquire(now);
            if (wait == RateLimiter::clock::duration::zero()) {
                at.push_back(now - t0);
                continue;
            }
            now += wait;
        }
        return at;
    }
}

TEST(RateLimiterTest, TwelveFramesAtFivePerSecond) {
    RateLimiter limiter(5);
    const auto t0 = RateLimiter::clock::now();

    const auto at = drain(limiter, 12, t0);
    ASSERT_EQ(at.size(), 12u);

    for (int i = 0; i < 5; ++i) EXPECT_EQ(at[i], 0s) << "frame " << i;
    for (int i = 5; i < 10; ++i) EXPECT_GE(at[i], 1s) << "frame " << i;
    for (int i = 10; i < 12; ++i) EXPECT_GE(at[i], 2s) << "frame " << i;
}

TEST(RateLimiterTest, NeverMoreThanLimitInAnyWindow) {
    RateLimiter limiter(3, 1s);
    const auto t0 = RateLimiter::clock::now();
    const auto at = drain(limiter, 20, t0);

    for (std::size_t i = 0; i + 3 < at.size(); ++i) {
        EXPECT_GE(at[i + 3] - at[i], 1s);
    }
}

TEST(RateLimiterTest, RefusalRecordsNothing) {
    RateLimiter limiter(1, 1s);
    const auto t0 = RateLimiter::clock::now();

    EXPECT_EQ(limiter.tryAcquire(t0), RateLimiter::clock::duration::zero());
    EXPECT_EQ(limiter.tryAcquire(t0 + 200ms), 800ms);
    EXPECT_EQ(limiter.tryAcquire(t0 + 400ms), 600ms);
    EXPECT_EQ(limiter.inWindow(t0 + 400ms), 1u);

    EXPECT_EQ(limiter.tryAcquire(t0 + 1s), RateLimiter::clock::duration::zero());
}

TEST(RateLimiterTest, ZeroLimitIsClampedToOne) {
    RateLimiter limiter(0);
    EXPECT_EQ(limiter.limit(), 1u);
}
