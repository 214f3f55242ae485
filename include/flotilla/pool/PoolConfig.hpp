#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace flotilla {

struct PoolConfig {
    size_t minInstances = 2;
    size_t maxInstances = 5;
    uint64_t maxMessagesPerInstance = 100;
    std::chrono::milliseconds maxInstanceAge{std::chrono::hours(1)};
    std::chrono::milliseconds staleTimeout{std::chrono::minutes(10)};
    std::chrono::milliseconds healthCheckInterval{std::chrono::seconds(30)};
    std::chrono::milliseconds acquireTimeout{std::chrono::seconds(30)};
    bool warmupOnStart = false;   // probe every instance once after initialize()

    /**
     * @throws std::invalid_argument describing the first violated bound
     */
    void validate() const;
};

} // namespace flotilla
