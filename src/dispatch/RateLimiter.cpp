#include "flotilla/dispatch/RateLimiter.hpp"
#include "flotilla/Errors.hpp"

namespace flotilla {

namespace {
// Acquires between sweeps of expired caller windows
constexpr size_t kSweepInterval = 256;
}

RateLimiter::RateLimiter(RateLimitConfig config) : config_(config) {}

void RateLimiter::acquire(const std::string& caller, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (++acquires_since_sweep_ >= kSweepInterval) {
        sweepLocked(now);
    }

    Window& window = windows_[caller];
    pruneLocked(window, now);

    if (window.size() >= config_.maxRequests) {
        auto retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(
            window.front() + config_.window - now);
        throw RateLimitExceeded("rate limit exceeded for caller " + caller + " (" +
                                    std::to_string(config_.maxRequests) + " per " +
                                    std::to_string(config_.window.count()) + "ms)",
                                retry_after);
    }
    window.push_back(now);
}

size_t RateLimiter::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepLocked(now);
}

size_t RateLimiter::trackedCallers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

size_t RateLimiter::remaining(const std::string& caller, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(caller);
    if (it == windows_.end()) {
        return config_.maxRequests;
    }
    pruneLocked(it->second, now);
    size_t used = it->second.size();
    if (used == 0) {
        windows_.erase(it);
    }
    return used >= config_.maxRequests ? 0 : config_.maxRequests - used;
}

size_t RateLimiter::sweepLocked(Clock::time_point now) {
    acquires_since_sweep_ = 0;
    size_t dropped = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        pruneLocked(it->second, now);
        if (it->second.empty()) {
            it = windows_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void RateLimiter::pruneLocked(Window& window, Clock::time_point now) const {
    while (!window.empty() && now - window.front() >= config_.window) {
        window.pop_front();
    }
}

} // namespace flotilla
