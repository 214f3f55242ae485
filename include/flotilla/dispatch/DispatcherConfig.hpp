#pragma once

#include "flotilla/balancer/LoadBalancer.hpp"
#include <chrono>
#include <cstddef>

namespace flotilla {

struct RateLimitConfig {
    size_t maxRequests = 1000;                                 // per caller per window
    std::chrono::milliseconds window{std::chrono::hours(1)};
};

struct DispatcherConfig {
    size_t concurrency = 3;
    unsigned maxAttempts = 3;
    std::chrono::milliseconds baseRetryDelay{std::chrono::seconds(2)};
    std::chrono::milliseconds maxRetryDelay{std::chrono::seconds(60)};
    std::chrono::milliseconds executionTimeout{std::chrono::seconds(30)};
    RateLimitConfig rateLimit;
    size_t maxQueueLength = 0;                                 // 0 = unbounded
    Strategy strategy = Strategy::ROUND_ROBIN;
    std::chrono::milliseconds defaultLatencyEstimate{std::chrono::seconds(5)};
    size_t retainedResults = 100;

    /**
     * @throws std::invalid_argument describing the first violated bound
     */
    void validate() const;

    /**
     * min(baseRetryDelay * 2^(attempts-1), maxRetryDelay)
     */
    std::chrono::milliseconds retryDelay(unsigned attempts) const;
};

} // namespace flotilla
