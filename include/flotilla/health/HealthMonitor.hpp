#pragma once

#include "flotilla/pool/PoolManager.hpp"
#include "flotilla/stats/PoolStats.hpp"
#include "flotilla/timer/TimerRing.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace flotilla {

class EventBus;

/**
 * Result of one health pass.
 */
struct HealthReport {
    size_t probed = 0;
    size_t failed = 0;         // failed probes, recycled
    size_t stale = 0;          // idle past staleTimeout, recycled
    size_t replenished = 0;
    PoolStats stats;
};

/**
 * Periodic probe/recycle/replenish loop on its own TimerRing.
 *
 * Each pass walks the instances that are idle at the start of the pass:
 * stale ones are recycled, the rest are reserved and probed. Busy
 * instances are left to the release path. The pool is then topped up to
 * minInstances and a HealthCheckCompleted event carries the snapshot.
 */
class HealthMonitor {
public:
    using StatsProvider = std::function<PoolStats()>;

    /**
     * @param stats Builds the snapshot attached to each pass
     * @param events Optional
     */
    HealthMonitor(PoolManager& pool, StatsProvider stats, EventBus* events = nullptr);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * Run a pass every pool healthCheckInterval.
     * @throws std::runtime_error if the timer ring cannot be set up
     */
    void start();

    /**
     * Cancel the timer and wait for a running pass to finish. Idempotent.
     */
    void stop();

    /**
     * Run one pass synchronously on the calling thread.
     */
    HealthReport runOnce();

    uint64_t passes() const;

private:
    PoolManager& pool_;
    StatsProvider stats_;
    EventBus* events_;
    TimerRing timer_;
    TimerRing::TimerId timer_id_ = 0;

    mutable std::mutex pass_mutex_;  // one pass at a time
    uint64_t passes_ = 0;
};

} // namespace flotilla
