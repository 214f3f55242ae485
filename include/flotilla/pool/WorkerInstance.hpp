#pragma once

#include "flotilla/pool/PoolConfig.hpp"
#include "flotilla/pool/WorkerBackend.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flotilla {

enum class InstanceHealth : uint8_t { HEALTHY, UNHEALTHY };

/**
 * How a job left an instance.
 * - COMPLETED: success, latency counts towards the response-time mean
 * - FAILED: job failed, instance still usable
 * - FAULTED: the backend reported itself broken, instance is recycled
 * - CANCELLED: execution was forcibly abandoned, instance is recycled
 */
enum class ReleaseDisposition : uint8_t { COMPLETED, FAILED, FAULTED, CANCELLED };

const char* releaseDispositionName(ReleaseDisposition disposition);

struct ConversationTurn {
    std::string role;     // "user" or "assistant"
    std::string content;
};

/**
 * Read-only view of one instance, as reported in PoolStats.
 */
struct InstanceStats {
    std::string id;
    bool busy = false;
    bool healthy = true;
    uint64_t messageCount = 0;
    uint32_t currentLoad = 0;
    unsigned weight = 1;
    std::chrono::milliseconds averageResponseTime{0};
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds idleFor{0};
    size_t conversationLength = 0;
};

/**
 * One pooled worker: a backend plus the bookkeeping the pool and the load
 * balancer need.
 *
 * Not thread-safe. Every field is read and written under the owning
 * PoolManager's lock; the backend itself is only touched outside it.
 */
class WorkerInstance {
public:
    using Clock = std::chrono::steady_clock;

    WorkerInstance(std::string id, std::shared_ptr<WorkerBackend> backend,
                   Clock::time_point now = Clock::now());

    WorkerInstance(const WorkerInstance&) = delete;
    WorkerInstance& operator=(const WorkerInstance&) = delete;

    const std::string& id() const { return id_; }
    const std::shared_ptr<WorkerBackend>& backend() const { return backend_; }

    bool busy() const { return busy_; }
    bool probing() const { return probing_; }
    InstanceHealth health() const { return health_; }
    bool healthy() const { return health_ == InstanceHealth::HEALTHY; }
    Clock::time_point createdAt() const { return created_at_; }
    Clock::time_point lastUsedAt() const { return last_used_at_; }
    uint64_t messageCount() const { return message_count_; }
    uint32_t currentLoad() const { return current_load_; }
    unsigned weight() const { return weight_; }
    std::chrono::milliseconds averageResponseTime() const { return average_response_time_; }
    uint64_t failureCount() const { return failure_count_; }
    size_t conversationLength() const { return conversation_.size(); }

    /**
     * Free, healthy and not reserved by a probe. Recycle thresholds are
     * checked separately by dueForRecycle().
     */
    bool available() const { return !busy_ && !probing_ && healthy(); }

    /**
     * Over the message budget, too old, or unhealthy.
     */
    bool dueForRecycle(const PoolConfig& config, Clock::time_point now) const;

    /**
     * Idle for longer than the configured stale timeout.
     */
    bool stale(const PoolConfig& config, Clock::time_point now) const;

    void markAcquired(Clock::time_point now);

    /**
     * Record the end of a job. COMPLETED folds latency into the mean,
     * FAULTED and CANCELLED mark the instance unhealthy.
     */
    void markReleased(ReleaseDisposition disposition, std::chrono::milliseconds latency,
                      Clock::time_point now);

    void beginProbe() { probing_ = true; }
    void endProbe(bool ok);
    void markUnhealthy() { health_ = InstanceHealth::UNHEALTHY; }

    /**
     * Append a prompt/response pair to this instance's private conversation.
     */
    void recordExchange(const std::string& input, const std::string& output);

    InstanceStats snapshot(Clock::time_point now) const;

private:
    std::string id_;
    std::shared_ptr<WorkerBackend> backend_;
    bool busy_ = false;
    bool probing_ = false;
    InstanceHealth health_ = InstanceHealth::HEALTHY;
    Clock::time_point created_at_;
    Clock::time_point last_used_at_;
    uint64_t message_count_ = 0;
    uint32_t current_load_ = 0;
    unsigned weight_;
    std::chrono::milliseconds average_response_time_{0};
    uint64_t completed_count_ = 0;  // samples in average_response_time_
    uint64_t failure_count_ = 0;
    std::vector<ConversationTurn> conversation_;
};

} // namespace flotilla
