#pragma once

#include "flotilla/pool/PoolConfig.hpp"
#include "flotilla/pool/WorkerBackend.hpp"
#include "flotilla/pool/WorkerInstance.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace flotilla {

class EventBus;

/**
 * An instance handed out by acquire(). The backend handle stays valid even
 * if the instance is recycled while the lease is held.
 */
struct InstanceLease {
    std::string instanceId;
    std::shared_ptr<WorkerBackend> backend;
};

/**
 * Picks one of the candidates, or nullptr to pick none. Runs under the pool
 * lock; it must not call back into the PoolManager.
 */
using InstanceSelector = std::function<WorkerInstance*(const std::vector<WorkerInstance*>& candidates)>;

enum class ProbeResult : uint8_t { SKIPPED, HEALTHY, FAILED };

/**
 * PoolManager - sole owner of the worker instances.
 *
 * One mutex guards the instance set, the waiter queue and every instance
 * field. Backend calls (factory, probe, cancel, dispose) always happen with
 * the lock released; a creation in progress holds a reserved slot so the
 * maxInstances bound is never overshot.
 *
 * Waiters are served strictly FIFO: whenever an instance becomes available
 * (release, creation, successful probe) it is handed straight to the
 * longest-waiting acquire() call.
 *
 * Usage:
 *   PoolManager pool(config, factory, &bus);
 *   pool.initialize();
 *   InstanceLease lease = pool.acquire(std::chrono::seconds(5));
 *   std::string out = lease.backend->execute(input, deadline);
 *   pool.release(lease.instanceId, ReleaseDisposition::COMPLETED, latency);
 */
class PoolManager {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param config Validated on construction
     * @param factory Produces one backend per instance id
     * @param events Optional; receives InstanceCreated/InstanceRecycled
     * @throws std::invalid_argument on invalid config or empty factory
     */
    PoolManager(PoolConfig config, BackendFactory factory, EventBus* events = nullptr);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * Create minInstances. Failing slots are logged and skipped; optional
     * warm-up probes every instance once.
     * @return number of instances created
     * @throws std::logic_error if called twice
     */
    size_t initialize();

    /**
     * Create one instance and offer it to the oldest waiter.
     * @throws CapacityError at maxInstances
     * @throws ProvisioningError if the factory fails
     * @throws ShuttingDown
     */
    std::string createInstance();

    /**
     * Lease a free, healthy instance, creating one if under maxInstances,
     * otherwise waiting up to `timeout` in FIFO order.
     * @param selector Chooses among eligible instances (default: first)
     * @param stop Abandons the wait when stop is requested on its source
     * @throws NoInstanceAvailable when the timeout elapses
     * @throws ProvisioningError if the pool is empty and creation fails
     * @throws ShuttingDown on pool shutdown or when `stop` fires
     */
    InstanceLease acquire(std::chrono::milliseconds timeout, const InstanceSelector& selector = nullptr,
                          std::stop_token stop = {});

    /**
     * Return an instance after a job. Recycles it when over its message
     * budget, too old, or unhealthy; otherwise serves the oldest waiter.
     * Unknown ids (recycled meanwhile) are ignored.
     */
    void release(const std::string& id, ReleaseDisposition disposition,
                 std::chrono::milliseconds latency = std::chrono::milliseconds(0));

    /**
     * Remove and dispose an instance, then top the pool back up to
     * minInstances. A busy instance is cancelled first.
     * @throws NotFound
     */
    void recycle(const std::string& id);

    /**
     * Recycle the instance if it has been idle longer than staleTimeout.
     * @return true if recycled
     */
    bool recycleIfStale(const std::string& id);

    /**
     * Reserve an idle instance for a probe. Reserved instances are not
     * eligible for acquire().
     * @return the backend, or nullptr if the instance is unknown, busy or
     *         already being probed
     */
    std::shared_ptr<WorkerBackend> beginProbe(const std::string& id);

    /**
     * Finish a probe. A failed probe marks the instance unhealthy and
     * recycles it; a passing one offers it to waiters.
     */
    void endProbe(const std::string& id, bool ok);

    /**
     * beginProbe + probe() + endProbe. Probe exceptions count as failure.
     */
    ProbeResult probeInstance(const std::string& id);

    /**
     * Create instances until minInstances (plus one per parked waiter while
     * under maxInstances). Failures are logged.
     * @return number created
     */
    size_t replenish();

    /**
     * Reject further acquires, cancel and dispose every instance, and fail
     * all parked waiters with ShuttingDown. Idempotent.
     */
    void shutdown();

    /**
     * Ids of instances that are neither busy nor being probed.
     */
    std::vector<std::string> idleInstanceIds() const;

    std::vector<InstanceStats> instanceStats() const;

    /**
     * Record a prompt/response pair on the instance's conversation.
     * Ignored if the instance is gone.
     */
    void recordExchange(const std::string& id, const std::string& input, const std::string& output);

    size_t size() const;
    size_t waiterCount() const;
    uint64_t recycledCount() const;
    bool isShuttingDown() const;
    const PoolConfig& config() const { return config_; }

private:
    using InstanceList = std::vector<std::unique_ptr<WorkerInstance>>;

    struct Waiter {
        std::condition_variable cv;
        std::optional<InstanceLease> lease;
        bool shutdown = false;
        bool abandoned = false;
    };

    struct Retired {
        std::string id;
        std::shared_ptr<WorkerBackend> backend;
        bool wasBusy = false;
    };

    InstanceList::iterator findLocked(const std::string& id);
    InstanceList::const_iterator findLocked(const std::string& id) const;

    std::vector<WorkerInstance*> eligibleLocked(Clock::time_point now) const;

    /**
     * Hand `instance` to the oldest waiter if it is usable.
     * @return true if handed off
     */
    bool offerLocked(WorkerInstance& instance);

    InstanceLease leaseLocked(WorkerInstance& instance, Clock::time_point now);

    /**
     * Call the factory for a slot already counted in pending_creates_.
     * Drops and re-takes `lock`. Releases the slot in every outcome.
     * @return id of the stored instance
     */
    std::string provision(std::unique_lock<std::mutex>& lock);

    Retired retireLocked(InstanceList::iterator it);

    /**
     * Cancel (if busy), dispose and announce a removed instance. Lock must
     * not be held.
     */
    void disposeRetired(const Retired& retired, const std::string& reason);

    size_t creationDeficitLocked() const;

    void publishCreated(const std::string& id);

    PoolConfig config_;
    BackendFactory factory_;
    EventBus* events_;

    mutable std::mutex mutex_;
    InstanceList instances_;  // creation order
    std::deque<Waiter*> waiters_;
    size_t pending_creates_ = 0;
    uint64_t recycled_count_ = 0;
    bool initialized_ = false;
    bool shutting_down_ = false;
};

} // namespace flotilla
