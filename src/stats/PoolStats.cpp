#include "flotilla/stats/PoolStats.hpp"
#include <iomanip>
#include <sstream>

namespace flotilla {

std::string formatPoolStats(const PoolStats& stats) {
    std::ostringstream oss;
    oss << "size=" << stats.poolSize
        << " busy=" << stats.busyCount
        << " healthy=" << stats.healthyCount
        << " util=" << std::fixed << std::setprecision(2) << stats.utilization
        << " queue=" << stats.queueLength
        << " waiters=" << stats.waiterCount
        << " requests=" << stats.totalRequests
        << " ok=" << stats.successCount
        << " failed=" << stats.failureCount
        << " retries=" << stats.retryCount
        << " recycled=" << stats.recycledCount
        << " avg_latency_ms=" << stats.averageLatency.count();
    return oss.str();
}

} // namespace flotilla
