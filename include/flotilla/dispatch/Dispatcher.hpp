#pragma once

#include "flotilla/balancer/LoadBalancer.hpp"
#include "flotilla/dispatch/DispatcherConfig.hpp"
#include "flotilla/dispatch/Job.hpp"
#include "flotilla/dispatch/RateLimiter.hpp"
#include "flotilla/pool/PoolManager.hpp"
#include "flotilla/timer/TimerRing.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace flotilla {

class EventBus;
enum class PoolEventType : uint8_t;
class JobHistorySink;

/**
 * Dispatcher - the job queue in front of a PoolManager.
 *
 * submit() rate-limits per caller, then inserts the job by priority (FIFO
 * within a priority). `concurrency` slot threads pop jobs, lease an
 * instance through the LoadBalancer and run the backend with a deadline.
 * Retryable failures wait out an exponential backoff on an io_uring timer
 * and rejoin the tail of their priority class.
 *
 * Each execute() runs on its own thread so a slot can abandon a hung
 * backend at the deadline: it calls cancel() on the backend and releases
 * the instance as CANCELLED, which recycles it.
 *
 * Events are never published while mutex_ is held, so observers may call
 * back into the dispatcher (submit, queueStatus, counters) from their
 * callbacks.
 */
class Dispatcher {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @throws std::invalid_argument on invalid config
     */
    Dispatcher(DispatcherConfig config, PoolManager& pool, EventBus* events = nullptr,
               JobHistorySink* history = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * Start the retry timer ring and the processing slots.
     * @throws std::runtime_error if the timer ring cannot be set up
     */
    void start();

    /**
     * @throws RateLimitExceeded if the caller is over quota (nothing recorded)
     * @throws CapacityError if the queue is at maxQueueLength
     * @throws InvalidJob for an empty payload or zero maxAttempts
     * @throws ShuttingDown once shutdown() has begun
     */
    SubmitReceipt submit(std::string payload, std::string callerId, const SubmitOptions& options = {});

    /**
     * Submit every payload as an independent job and wait for all of them.
     * Submission errors become failed outcomes in place.
     */
    std::vector<JobOutcome> submitBatch(const std::vector<std::string>& payloads, const std::string& callerId,
                                        const SubmitOptions& options = {});

    /**
     * Block until the job is terminal. Retained outcomes are served after
     * completion.
     * @throws NotFound for unknown or evicted ids
     */
    JobOutcome awaitResult(const std::string& jobId);

    /**
     * @throws NotFound for unknown or evicted ids
     */
    std::shared_future<JobOutcome> handle(const std::string& jobId);

    /**
     * Cancel a queued or backing-off job.
     * @return false if the job is unknown, running or already terminal
     */
    bool cancel(const std::string& jobId);

    QueueStatus queueStatus() const;

    size_t remainingRequests(const std::string& callerId);

    DispatchCounters counters() const;

    /**
     * Stop accepting jobs, abandon in-flight executions, fail every queued
     * and backing-off job with ShuttingDown, and join the slots.
     */
    void shutdown();

    const DispatcherConfig& config() const { return config_; }

private:
    struct Job;
    struct Execution;
    using JobPtr = std::shared_ptr<Job>;

    void slotLoop(size_t slot);
    void runAttempt(const JobPtr& job);
    void onAttemptFailed(const JobPtr& job, ErrorCode code, const std::string& reason, bool retryable);
    void scheduleRetry(const JobPtr& job, std::chrono::milliseconds delay);
    void requeue(const JobPtr& job);
    void finish(const JobPtr& job, JobStatus status, ErrorCode code, const std::string& reason,
                std::string output = {});

    size_t enqueueLocked(const JobPtr& job);
    void retainLocked(const std::string& jobId, std::shared_future<JobOutcome> future);
    std::chrono::milliseconds averageLatencyLocked() const;
    void publish(PoolEventType type, const JobPtr& job, const std::string& detail = {});

    DispatcherConfig config_;
    PoolManager& pool_;
    LoadBalancer balancer_;
    RateLimiter rate_limiter_;
    EventBus* events_;
    JobHistorySink* history_;
    TimerRing retry_timers_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<JobPtr> queue_;
    std::unordered_map<std::string, JobPtr> jobs_;  // submitted, not yet terminal
    std::unordered_map<std::string, std::shared_ptr<Execution>> executions_;
    std::unordered_map<std::string, std::shared_future<JobOutcome>> retained_;
    std::deque<std::string> retained_order_;
    size_t in_flight_ = 0;
    bool started_ = false;
    bool stopping_ = false;

    uint64_t total_requests_ = 0;
    uint64_t success_count_ = 0;
    uint64_t failure_count_ = 0;
    uint64_t cancelled_count_ = 0;
    uint64_t retry_count_ = 0;
    uint64_t latency_samples_ = 0;
    std::chrono::milliseconds average_latency_{0};

    std::stop_source stop_source_;
    std::mutex join_mutex_;
    std::vector<std::thread> slots_;
};

} // namespace flotilla
