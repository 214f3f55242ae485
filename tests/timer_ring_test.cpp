#include <gtest/gtest.h>
#include "flotilla/timer/TimerRing.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace flotilla;
using namespace std::chrono_literals;

class TimerRingTest : public ::testing::Test {
protected:
    void SetUp() override {
        ring_ = std::make_unique<TimerRing>("test");
        ring_->start();
    }

    void TearDown() override {
        ring_->stop();
        ring_.reset();
    }

    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }

    std::unique_ptr<TimerRing> ring_;
};

// ============================================================================
// One-shot timers
// ============================================================================

TEST_F(TimerRingTest, OneShotFiresAfterDelay) {
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<int64_t> elapsed_ms{0};

    ring_->schedule(50ms, [&] {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start).count();
        fired = true;
    });

    ASSERT_TRUE(waitFor([&] { return fired.load(); }));
    EXPECT_GE(elapsed_ms.load(), 45);
    EXPECT_TRUE(waitFor([&] { return ring_->pending() == 0; }));
}

TEST_F(TimerRingTest, OneShotFiresOnce) {
    std::atomic<int> count{0};
    ring_->schedule(10ms, [&] { count++; });

    ASSERT_TRUE(waitFor([&] { return count.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(count.load(), 1);
}

TEST_F(TimerRingTest, ZeroAndNegativeDelaysFireImmediately) {
    std::atomic<int> count{0};
    ring_->schedule(0ms, [&] { count++; });
    ring_->schedule(-5ms, [&] { count++; });
    EXPECT_TRUE(waitFor([&] { return count.load() == 2; }, 500ms));
}

TEST_F(TimerRingTest, TimersFireInDeadlineOrder) {
    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int v) {
        return [&, v] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(v);
        };
    };

    ring_->schedule(90ms, record(3));
    ring_->schedule(10ms, record(1));
    ring_->schedule(50ms, record(2));

    ASSERT_TRUE(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 3;
    }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(TimerRingTest, CancelledTimerNeverFires) {
    std::atomic<bool> fired{false};
    auto id = ring_->schedule(100ms, [&] { fired = true; });

    EXPECT_TRUE(ring_->cancel(id));
    EXPECT_FALSE(ring_->cancel(id));
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(fired.load());
    EXPECT_TRUE(waitFor([&] { return ring_->pending() == 0; }));
}

TEST_F(TimerRingTest, CancelUnknownIdReturnsFalse) {
    EXPECT_FALSE(ring_->cancel(424242));
}

TEST_F(TimerRingTest, RepeatingTimerFiresUntilCancelled) {
    std::atomic<int> count{0};
    auto id = ring_->scheduleRepeating(10ms, [&] { count++; });

    ASSERT_TRUE(waitFor([&] { return count.load() >= 3; }));
    ASSERT_TRUE(ring_->cancel(id));

    // A firing may already be in progress when cancel lands
    std::this_thread::sleep_for(30ms);
    int settled = count.load();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(count.load(), settled);
}

TEST_F(TimerRingTest, RepeatingTimerCanCancelItself) {
    std::atomic<int> count{0};
    std::atomic<TimerRing::TimerId> self{0};
    std::atomic<bool> armed{false};

    self = ring_->scheduleRepeating(10ms, [&] {
        while (!armed.load()) {
            std::this_thread::yield();
        }
        if (++count == 2) {
            ring_->cancel(self.load());
        }
    });
    armed = true;

    ASSERT_TRUE(waitFor([&] { return count.load() == 2; }));
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(count.load(), 2);
}

TEST_F(TimerRingTest, RepeatingIntervalMustBePositive) {
    EXPECT_THROW(ring_->scheduleRepeating(0ms, [] {}), std::invalid_argument);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TimerRingTest, CallbackExceptionDoesNotStopRing) {
    std::atomic<bool> later{false};
    ring_->schedule(5ms, [] { throw std::runtime_error("boom"); });
    ring_->schedule(30ms, [&] { later = true; });
    EXPECT_TRUE(waitFor([&] { return later.load(); }));
    EXPECT_TRUE(ring_->isRunning());
}

TEST_F(TimerRingTest, ScheduleFromCallback) {
    std::atomic<bool> second{false};
    ring_->schedule(5ms, [&] {
        ring_->schedule(5ms, [&] { second = true; });
    });
    EXPECT_TRUE(waitFor([&] { return second.load(); }));
}

TEST_F(TimerRingTest, StopDropsPendingTimers) {
    std::atomic<bool> fired{false};
    ring_->schedule(200ms, [&] { fired = true; });
    ring_->stop();
    EXPECT_FALSE(ring_->isRunning());
    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(fired.load());
    EXPECT_EQ(ring_->pending(), 0u);
}

TEST_F(TimerRingTest, ScheduleAfterStopThrows) {
    ring_->stop();
    EXPECT_THROW(ring_->schedule(1ms, [] {}), std::logic_error);
}

TEST_F(TimerRingTest, StopIsIdempotent) {
    ring_->stop();
    EXPECT_NO_THROW(ring_->stop());
}

TEST_F(TimerRingTest, RestartAfterStopIsRejected) {
    ring_->stop();
    EXPECT_THROW(ring_->start(), std::logic_error);
}

TEST_F(TimerRingTest, StopFromCallbackDoesNotDeadlock) {
    std::atomic<bool> ran{false};
    ring_->schedule(5ms, [&] {
        ring_->stop();
        ran = true;
    });
    ASSERT_TRUE(waitFor([&] { return ran.load(); }));
    EXPECT_FALSE(ring_->isRunning());
}
