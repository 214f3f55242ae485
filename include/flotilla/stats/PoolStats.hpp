#pragma once

#include "flotilla/pool/WorkerInstance.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace flotilla {

/**
 * Point-in-time view of a pool. Derived on demand; nothing reads it back to
 * make decisions.
 */
struct PoolStats {
    size_t poolSize = 0;
    size_t busyCount = 0;
    size_t healthyCount = 0;
    double utilization = 0.0;     // busyCount / poolSize, 0 when empty
    std::chrono::milliseconds averageLatency{0};
    uint64_t totalRequests = 0;
    uint64_t successCount = 0;
    uint64_t failureCount = 0;
    uint64_t retryCount = 0;
    uint64_t recycledCount = 0;
    size_t queueLength = 0;
    size_t waiterCount = 0;
    size_t minInstances = 0;
    size_t maxInstances = 0;
    std::vector<InstanceStats> instances;
};

/**
 * One-line summary for logs: "size=3 busy=1 healthy=3 util=0.33 queue=0 ..."
 */
std::string formatPoolStats(const PoolStats& stats);

} // namespace flotilla
