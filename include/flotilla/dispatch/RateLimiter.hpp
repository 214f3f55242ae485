#pragma once

#include "flotilla/dispatch/DispatcherConfig.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace flotilla {

/**
 * Sliding-window request limit per caller. A request counts against the
 * window for `window` after it was accepted; rejected requests are not
 * recorded.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(RateLimitConfig config);

    /**
     * Record one request for `caller`.
     * @throws RateLimitExceeded with the time until the oldest request expires
     */
    void acquire(const std::string& caller, Clock::time_point now = Clock::now());

    /**
     * Requests `caller` may still make in the current window.
     */
    size_t remaining(const std::string& caller, Clock::time_point now = Clock::now());

    /**
     * Forget callers with no request left in their window. acquire() also
     * does this every few hundred calls, so one-off callers do not pile up.
     * @return Number of callers dropped
     */
    size_t sweep(Clock::time_point now = Clock::now());

    size_t trackedCallers() const;

    const RateLimitConfig& config() const { return config_; }

private:
    using Window = std::deque<Clock::time_point>;

    size_t sweepLocked(Clock::time_point now);
    void pruneLocked(Window& window, Clock::time_point now) const;

    RateLimitConfig config_;
    mutable std::mutex mutex_;
    size_t acquires_since_sweep_ = 0;
    std::unordered_map<std::string, Window> windows_;
};

} // namespace flotilla
