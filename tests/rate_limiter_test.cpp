#include <gtest/gtest.h>
#include "flotilla/Errors.hpp"
#include "flotilla/dispatch/RateLimiter.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace flotilla;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
    RateLimiter::Clock::time_point t0_ = RateLimiter::Clock::now();
};

// ============================================================================
// Window accounting
// ============================================================================

TEST_F(RateLimiterTest, AcceptsUpToLimitThenRejects) {
    RateLimiter limiter(RateLimitConfig{5, 1h});
    for (int i = 0; i < 5; ++i) {
        EXPECT_NO_THROW(limiter.acquire("alice", t0_ + std::chrono::seconds(i)));
    }
    EXPECT_THROW(limiter.acquire("alice", t0_ + 10s), RateLimitExceeded);
    EXPECT_EQ(limiter.remaining("alice", t0_ + 10s), 0u);
}

TEST_F(RateLimiterTest, RetryAfterPointsAtOldestExpiry) {
    RateLimiter limiter(RateLimitConfig{2, 1min});
    limiter.acquire("bob", t0_);
    limiter.acquire("bob", t0_ + 10s);

    try {
        limiter.acquire("bob", t0_ + 20s);
        FAIL() << "expected RateLimitExceeded";
    } catch (const RateLimitExceeded& e) {
        EXPECT_EQ(e.retryAfter(), 40s);
        EXPECT_EQ(e.code(), ErrorCode::RATE_LIMIT_EXCEEDED);
    }
}

TEST_F(RateLimiterTest, RequestsExpireAfterWindow) {
    RateLimiter limiter(RateLimitConfig{1, 1min});
    limiter.acquire("carol", t0_);
    EXPECT_THROW(limiter.acquire("carol", t0_ + 59s), RateLimitExceeded);
    EXPECT_NO_THROW(limiter.acquire("carol", t0_ + 60s));
}

TEST_F(RateLimiterTest, RejectedRequestsAreNotRecorded) {
    RateLimiter limiter(RateLimitConfig{1, 1min});
    limiter.acquire("dave", t0_);
    for (int i = 1; i < 10; ++i) {
        EXPECT_THROW(limiter.acquire("dave", t0_ + std::chrono::seconds(i)), RateLimitExceeded);
    }
    // Only the accepted request occupies the window
    EXPECT_NO_THROW(limiter.acquire("dave", t0_ + 61s));
}

TEST_F(RateLimiterTest, CallersAreIndependent) {
    RateLimiter limiter(RateLimitConfig{1, 1h});
    limiter.acquire("erin", t0_);
    EXPECT_NO_THROW(limiter.acquire("frank", t0_));
    EXPECT_EQ(limiter.remaining("grace", t0_), 1u);
}

TEST_F(RateLimiterTest, RemainingCountsDown) {
    RateLimiter limiter(RateLimitConfig{3, 1h});
    EXPECT_EQ(limiter.remaining("heidi", t0_), 3u);
    limiter.acquire("heidi", t0_);
    EXPECT_EQ(limiter.remaining("heidi", t0_), 2u);
    EXPECT_EQ(limiter.remaining("heidi", t0_ + 2h), 3u);
}

TEST_F(RateLimiterTest, SweepForgetsCallersWithExpiredWindows) {
    RateLimiter limiter(RateLimitConfig{5, 1min});
    for (int i = 0; i < 1000; ++i) {
        limiter.acquire("visitor-" + std::to_string(i), t0_);
    }
    EXPECT_EQ(limiter.trackedCallers(), 1000u);

    EXPECT_EQ(limiter.sweep(t0_ + 30s), 0u);
    EXPECT_EQ(limiter.sweep(t0_ + 1min), 1000u);
    EXPECT_EQ(limiter.trackedCallers(), 0u);
    EXPECT_EQ(limiter.remaining("visitor-7", t0_ + 1min), 5u);
}

TEST_F(RateLimiterTest, AcquireDropsExpiredCallersAsItGoes) {
    RateLimiter limiter(RateLimitConfig{1000, 1min});
    for (int i = 0; i < 300; ++i) {
        limiter.acquire("visitor-" + std::to_string(i), t0_);
    }
    EXPECT_EQ(limiter.trackedCallers(), 300u);

    // One steady caller after the window keeps the map from growing
    for (int i = 0; i < 256; ++i) {
        limiter.acquire("steady", t0_ + 2min);
    }
    EXPECT_EQ(limiter.trackedCallers(), 1u);
    EXPECT_EQ(limiter.remaining("steady", t0_ + 2min), 1000u - 256u);
}

TEST_F(RateLimiterTest, ConcurrentCallersNeverExceedLimit) {
    RateLimiter limiter(RateLimitConfig{100, 1h});
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                try {
                    limiter.acquire("shared");
                    accepted++;
                } catch (const RateLimitExceeded&) {
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(accepted.load(), 100);
}

// ============================================================================
// Retry schedule
// ============================================================================

TEST(DispatcherConfigTest, RetryDelayDoublesUpToCap) {
    DispatcherConfig config;
    config.baseRetryDelay = 100ms;
    config.maxRetryDelay = 1s;

    EXPECT_EQ(config.retryDelay(1), 100ms);
    EXPECT_EQ(config.retryDelay(2), 200ms);
    EXPECT_EQ(config.retryDelay(3), 400ms);
    EXPECT_EQ(config.retryDelay(4), 800ms);
    EXPECT_EQ(config.retryDelay(5), 1s);
    EXPECT_EQ(config.retryDelay(40), 1s);
}

TEST(DispatcherConfigTest, ValidateRejectsBadBounds) {
    DispatcherConfig config;
    EXPECT_NO_THROW(config.validate());

    DispatcherConfig zero_concurrency;
    zero_concurrency.concurrency = 0;
    EXPECT_THROW(zero_concurrency.validate(), std::invalid_argument);

    DispatcherConfig inverted;
    inverted.baseRetryDelay = 10s;
    inverted.maxRetryDelay = 1s;
    EXPECT_THROW(inverted.validate(), std::invalid_argument);

    DispatcherConfig no_quota;
    no_quota.rateLimit.maxRequests = 0;
    EXPECT_THROW(no_quota.validate(), std::invalid_argument);
}
