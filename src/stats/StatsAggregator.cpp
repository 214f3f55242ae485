#include "flotilla/stats/StatsAggregator.hpp"
#include "flotilla/dispatch/Dispatcher.hpp"
#include "flotilla/pool/PoolManager.hpp"

namespace flotilla {

StatsAggregator::StatsAggregator(const PoolManager& pool, const Dispatcher* dispatcher)
    : pool_(pool), dispatcher_(dispatcher) {
}

PoolStats StatsAggregator::snapshot() const {
    PoolStats stats;
    stats.instances = pool_.instanceStats();
    stats.poolSize = stats.instances.size();
    for (const auto& instance : stats.instances) {
        if (instance.busy) {
            ++stats.busyCount;
        }
        if (instance.healthy) {
            ++stats.healthyCount;
        }
    }
    stats.utilization = stats.poolSize == 0
                            ? 0.0
                            : static_cast<double>(stats.busyCount) / static_cast<double>(stats.poolSize);
    stats.recycledCount = pool_.recycledCount();
    stats.waiterCount = pool_.waiterCount();
    stats.minInstances = pool_.config().minInstances;
    stats.maxInstances = pool_.config().maxInstances;

    if (dispatcher_) {
        DispatchCounters counters = dispatcher_->counters();
        stats.totalRequests = counters.totalRequests;
        stats.successCount = counters.successCount;
        stats.failureCount = counters.failureCount;
        stats.retryCount = counters.retryCount;
        stats.averageLatency = counters.averageLatency;
        stats.queueLength = counters.queueLength;
    }
    return stats;
}

} // namespace flotilla
