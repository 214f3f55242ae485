#include "flotilla/dispatch/DispatcherConfig.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace flotilla {

void DispatcherConfig::validate() const {
    if (concurrency < 1) {
        throw std::invalid_argument("DispatcherConfig: concurrency must be at least 1");
    }
    if (maxAttempts < 1) {
        throw std::invalid_argument("DispatcherConfig: maxAttempts must be at least 1");
    }
    if (baseRetryDelay.count() < 0 || maxRetryDelay.count() < 0) {
        throw std::invalid_argument("DispatcherConfig: retry delays must not be negative");
    }
    if (maxRetryDelay < baseRetryDelay) {
        throw std::invalid_argument("DispatcherConfig: maxRetryDelay is below baseRetryDelay");
    }
    if (executionTimeout.count() <= 0) {
        throw std::invalid_argument("DispatcherConfig: executionTimeout must be positive");
    }
    if (rateLimit.maxRequests < 1) {
        throw std::invalid_argument("DispatcherConfig: rateLimit.maxRequests must be at least 1");
    }
    if (rateLimit.window.count() <= 0) {
        throw std::invalid_argument("DispatcherConfig: rateLimit.window must be positive");
    }
    if (defaultLatencyEstimate.count() < 0) {
        throw std::invalid_argument("DispatcherConfig: defaultLatencyEstimate must not be negative");
    }
}

std::chrono::milliseconds DispatcherConfig::retryDelay(unsigned attempts) const {
    if (attempts <= 1) {
        return std::min(baseRetryDelay, maxRetryDelay);
    }
    auto delay = baseRetryDelay;
    for (unsigned i = 1; i < attempts; ++i) {
        delay *= 2;
        if (delay >= maxRetryDelay) {
            return maxRetryDelay;
        }
    }
    return delay;
}

} // namespace flotilla
