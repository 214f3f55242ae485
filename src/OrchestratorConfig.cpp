#include "flotilla/OrchestratorConfig.hpp"
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace flotilla {

namespace {

const char* lookup(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint64_t parseUnsigned(const char* name, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + value + "'");
    }
    size_t consumed = 0;
    unsigned long long parsed;
    try {
        parsed = std::stoull(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(std::string(name) + ": trailing characters in '" + value + "'");
    }
    return parsed;
}

template <typename T>
void overlayCount(const char* name, T& field) {
    if (const char* e = lookup(name)) {
        field = static_cast<T>(parseUnsigned(name, e));
    }
}

void overlayMillis(const char* name, std::chrono::milliseconds& field) {
    if (const char* e = lookup(name)) {
        field = std::chrono::milliseconds(static_cast<int64_t>(parseUnsigned(name, e)));
    }
}

} // namespace

void OrchestratorConfig::validate() const {
    pool.validate();
    dispatcher.validate();
}

void OrchestratorConfig::applyEnvironment() {
    overlayCount("FLOTILLA_MIN_INSTANCES", pool.minInstances);
    overlayCount("FLOTILLA_MAX_INSTANCES", pool.maxInstances);
    overlayCount("FLOTILLA_MAX_MESSAGES", pool.maxMessagesPerInstance);
    overlayMillis("FLOTILLA_MAX_AGE_MS", pool.maxInstanceAge);
    overlayMillis("FLOTILLA_STALE_TIMEOUT_MS", pool.staleTimeout);
    overlayMillis("FLOTILLA_HEALTH_INTERVAL_MS", pool.healthCheckInterval);
    overlayMillis("FLOTILLA_ACQUIRE_TIMEOUT_MS", pool.acquireTimeout);

    overlayCount("FLOTILLA_CONCURRENCY", dispatcher.concurrency);
    overlayCount("FLOTILLA_MAX_ATTEMPTS", dispatcher.maxAttempts);
    overlayMillis("FLOTILLA_RETRY_DELAY_MS", dispatcher.baseRetryDelay);
    overlayMillis("FLOTILLA_EXEC_TIMEOUT_MS", dispatcher.executionTimeout);
    overlayCount("FLOTILLA_RATE_LIMIT", dispatcher.rateLimit.maxRequests);
    overlayMillis("FLOTILLA_RATE_WINDOW_MS", dispatcher.rateLimit.window);

    if (const char* e = lookup("FLOTILLA_STRATEGY")) {
        try {
            dispatcher.strategy = parseStrategy(e);
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(std::string("FLOTILLA_STRATEGY: ") + ex.what());
        }
    }
    if (const char* e = lookup("FLOTILLA_LOG_LEVEL")) {
        try {
            logLevel = parseLogLevel(e);
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(std::string("FLOTILLA_LOG_LEVEL: ") + ex.what());
        }
    }
}

OrchestratorConfig OrchestratorConfig::fromEnvironment() {
    OrchestratorConfig config;
    config.applyEnvironment();
    return config;
}

} // namespace flotilla
