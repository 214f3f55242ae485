#pragma once

#include "flotilla/OrchestratorConfig.hpp"
#include "flotilla/dispatch/Dispatcher.hpp"
#include "flotilla/dispatch/Job.hpp"
#include "flotilla/dispatch/JobHistorySink.hpp"
#include "flotilla/events/EventBus.hpp"
#include "flotilla/health/HealthMonitor.hpp"
#include "flotilla/pool/PoolManager.hpp"
#include "flotilla/pool/WorkerBackend.hpp"
#include "flotilla/stats/PoolStats.hpp"
#include "flotilla/stats/StatsAggregator.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flotilla {

/**
 * Orchestrator - one pool of worker instances behind a job queue.
 *
 * Wires PoolManager, LoadBalancer (inside the Dispatcher), Dispatcher,
 * HealthMonitor, StatsAggregator and EventBus together. Each value is an
 * independent pool; nothing is process-global apart from the Logger.
 *
 * Usage:
 *   Orchestrator pool(OrchestratorConfig::fromEnvironment(), makeBackend);
 *   pool.initialize();
 *   auto receipt = pool.submit("hello", "caller-1");
 *   JobOutcome outcome = pool.awaitResult(receipt.jobId);
 *   pool.shutdown();
 */
class Orchestrator {
public:
    /**
     * @param history Optional; must outlive the orchestrator
     */
    Orchestrator(OrchestratorConfig config, BackendFactory factory, JobHistorySink* history = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Validate the configuration, create minInstances, start the dispatcher
     * and the health monitor. An under-provisioned start is logged, not
     * fatal.
     * @throws std::invalid_argument for invalid configuration
     * @throws std::logic_error if called twice
     */
    PoolStats initialize();

    SubmitReceipt submit(std::string payload, std::string callerId, const SubmitOptions& options = {});

    std::vector<JobOutcome> submitBatch(const std::vector<std::string>& payloads, const std::string& callerId,
                                        const SubmitOptions& options = {});

    bool cancel(const std::string& jobId);

    QueueStatus queueStatus() const;

    size_t remainingRequests(const std::string& callerId);

    JobOutcome awaitResult(const std::string& jobId);

    PoolStats stats() const;

    /**
     * @throws NotFound
     */
    void recycle(const std::string& instanceId);

    /**
     * Run a health pass now instead of waiting for the timer.
     */
    HealthReport checkHealth();

    void subscribe(PoolObserver& observer);
    void unsubscribe(PoolObserver& observer);

    /**
     * Stop health checks, recycle every instance, fail outstanding jobs
     * with ShuttingDown and deliver the remaining events. Idempotent.
     */
    void shutdown();

    const OrchestratorConfig& config() const { return config_; }

private:
    void requireRunning() const;

    OrchestratorConfig config_;
    BackendFactory factory_;
    JobHistorySink* history_;

    EventBus events_;
    std::unique_ptr<PoolManager> pool_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<StatsAggregator> stats_;
    std::unique_ptr<HealthMonitor> health_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace flotilla
