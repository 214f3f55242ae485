#include "flotilla/dispatch/Dispatcher.hpp"
#include "flotilla/Config.hpp"
#include "flotilla/Errors.hpp"
#include "flotilla/dispatch/JobHistorySink.hpp"
#include "flotilla/events/EventBus.hpp"
#include "flotilla/logger/Logger.hpp"
#include "flotilla/util/IdGenerator.hpp"
#include "flotilla/util/JobStateMachine.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>

namespace flotilla {

const char* jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::COMPLETED: return "completed";
    case JobStatus::FAILED: return "failed";
    case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

namespace {
// Outcomes carry one short line, never a downstream dump
std::string shortReason(const std::string& what) {
    constexpr size_t kMaxReason = 200;
    std::string line = what.substr(0, what.find('\n'));
    if (line.size() > kMaxReason) {
        line.resize(kMaxReason - 3);
        line += "...";
    }
    return line;
}
}

struct Dispatcher::Job {
    std::string id;
    std::string payload;
    std::string callerId;
    int priority = 0;
    unsigned maxAttempts = 1;
    Strategy strategy = Strategy::ROUND_ROBIN;
    std::chrono::milliseconds executionTimeout{0};
    Clock::time_point createdAt;

    std::atomic<unsigned> attempts{0};
    // Written by the slot that holds the job in DISPATCHED
    std::string lastInstanceId;
    std::chrono::milliseconds lastLatency{0};
    TimerRing::TimerId retryTimer = 0;  // guarded by Dispatcher::mutex_
    // Set once JobQueued has been published; JobDispatched waits for it
    std::atomic<bool> announced{false};

    JobStateMachine state;
    std::promise<JobOutcome> promise;
    std::shared_future<JobOutcome> future;
};

// Shared between a slot and the thread running execute(); the slot may
// walk away at the deadline, the executor never blocks on it.
struct Dispatcher::Execution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool aborted = false;
    std::string output;
    std::exception_ptr error;
};

Dispatcher::Dispatcher(DispatcherConfig config, PoolManager& pool, EventBus* events, JobHistorySink* history)
    : config_(std::move(config)), pool_(pool), balancer_(config_.strategy),
      rate_limiter_(config_.rateLimit), events_(events), history_(history), retry_timers_("retry") {
    config_.validate();
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw std::logic_error("Dispatcher: already started");
    }
    if (stopping_) {
        throw ShuttingDown("Dispatcher: shutting down");
    }

    retry_timers_.start();
    started_ = true;
    for (size_t i = 0; i < config_.concurrency; ++i) {
        slots_.emplace_back(&Dispatcher::slotLoop, this, i);
    }

    Logger::getInstance().logMessage("Dispatcher: started " + std::to_string(config_.concurrency) +
                                     " processing slots, strategy " + strategyName(config_.strategy));
}

SubmitReceipt Dispatcher::submit(std::string payload, std::string callerId, const SubmitOptions& options) {
    if (payload.empty()) {
        throw InvalidJob("Dispatcher: empty payload");
    }
    unsigned max_attempts = options.maxAttempts.value_or(config_.maxAttempts);
    if (max_attempts == 0) {
        throw InvalidJob("Dispatcher: maxAttempts must be at least 1");
    }
    auto execution_timeout = options.executionTimeout.value_or(config_.executionTimeout);
    if (execution_timeout.count() <= 0) {
        throw InvalidJob("Dispatcher: executionTimeout must be positive");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ShuttingDown("Dispatcher: shutting down");
        }
        if (!started_) {
            throw std::logic_error("Dispatcher: not started");
        }
    }

    rate_limiter_.acquire(callerId);

    auto job = std::make_shared<Job>();
    job->id = IdGenerator::generate("job");
    job->payload = std::move(payload);
    job->callerId = std::move(callerId);
    job->priority = options.priority;
    job->maxAttempts = max_attempts;
    job->strategy = options.strategy.value_or(config_.strategy);
    job->executionTimeout = execution_timeout;
    job->createdAt = Clock::now();
    job->future = job->promise.get_future().share();

    SubmitReceipt receipt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ShuttingDown("Dispatcher: shutting down");
        }
        if (config_.maxQueueLength > 0 && queue_.size() >= config_.maxQueueLength) {
            throw CapacityError("Dispatcher: queue full (" + std::to_string(config_.maxQueueLength) + " jobs)");
        }

        receipt.jobId = job->id;
        receipt.queuePosition = enqueueLocked(job);
        receipt.estimatedWait = std::chrono::milliseconds(
            static_cast<int64_t>(receipt.queuePosition) * averageLatencyLocked().count() /
            static_cast<int64_t>(config_.concurrency));
        jobs_.emplace(job->id, job);
        ++total_requests_;
    }

    // Published without mutex_: an observer may call back into the dispatcher
    publish(PoolEventType::JOB_QUEUED, job, "position " + std::to_string(receipt.queuePosition));
    job->announced.store(true, std::memory_order_release);
    job->announced.notify_all();
    queue_cv_.notify_one();

    FLOTILLA_DEBUG_LOG("Dispatcher: queued " << receipt.jobId << " at position " << receipt.queuePosition);
    return receipt;
}

std::vector<JobOutcome> Dispatcher::submitBatch(const std::vector<std::string>& payloads,
                                                const std::string& callerId, const SubmitOptions& options) {
    std::vector<JobOutcome> results(payloads.size());
    std::vector<std::pair<size_t, std::shared_future<JobOutcome>>> pending;

    for (size_t i = 0; i < payloads.size(); ++i) {
        try {
            SubmitReceipt receipt = submit(payloads[i], callerId, options);
            pending.emplace_back(i, handle(receipt.jobId));
        } catch (const PoolError& e) {
            results[i].status = JobStatus::FAILED;
            results[i].error = e.code();
            results[i].reason = shortReason(e.what());
        }
    }

    for (auto& [index, future] : pending) {
        results[index] = future.get();
    }
    return results;
}

JobOutcome Dispatcher::awaitResult(const std::string& jobId) {
    return handle(jobId).get();
}

std::shared_future<JobOutcome> Dispatcher::handle(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto live = jobs_.find(jobId);
    if (live != jobs_.end()) {
        return live->second->future;
    }
    auto retained = retained_.find(jobId);
    if (retained != retained_.end()) {
        return retained->second;
    }
    throw NotFound("Dispatcher: unknown job " + jobId);
}

bool Dispatcher::cancel(const std::string& jobId) {
    JobPtr job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            return false;
        }
        job = it->second;
        if (!job->state.tryCancel()) {
            return false;
        }

        queue_.erase(std::remove(queue_.begin(), queue_.end(), job), queue_.end());
        if (job->retryTimer != 0) {
            retry_timers_.cancel(job->retryTimer);
            job->retryTimer = 0;
        }
    }

    finish(job, JobStatus::CANCELLED, ErrorCode::CANCELLED, "cancelled by caller");
    return true;
}

QueueStatus Dispatcher::queueStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStatus status;
    status.length = queue_.size();
    status.inFlight = in_flight_;
    for (const auto& [id, job] : jobs_) {
        if (job->state.getState() == JobStateMachine::State::BACKOFF) {
            ++status.backingOff;
        }
    }

    auto now = Clock::now();
    status.jobs.reserve(queue_.size());
    size_t position = 0;
    for (const auto& job : queue_) {
        QueuedJobInfo info;
        info.jobId = job->id;
        info.callerId = job->callerId;
        info.priority = job->priority;
        info.position = ++position;
        info.attempts = job->attempts.load();
        info.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - job->createdAt);
        status.jobs.push_back(std::move(info));
    }
    return status;
}

size_t Dispatcher::remainingRequests(const std::string& callerId) {
    return rate_limiter_.remaining(callerId);
}

DispatchCounters Dispatcher::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DispatchCounters counters;
    counters.totalRequests = total_requests_;
    counters.successCount = success_count_;
    counters.failureCount = failure_count_;
    counters.cancelledCount = cancelled_count_;
    counters.retryCount = retry_count_;
    counters.averageLatency = average_latency_;
    counters.queueLength = queue_.size();
    counters.inFlight = in_flight_;
    return counters;
}

void Dispatcher::shutdown() {
    std::vector<JobPtr> pending;
    std::vector<std::shared_ptr<Execution>> running;
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            stopping_ = true;
            first = true;
            for (const auto& [id, job] : jobs_) {
                pending.push_back(job);
            }
            for (const auto& [id, execution] : executions_) {
                running.push_back(execution);
            }
            queue_.clear();
        }
    }

    if (first) {
        queue_cv_.notify_all();
        // Slots parked in pool_.acquire() give up instead of waiting out acquireTimeout
        stop_source_.request_stop();
        for (auto& execution : running) {
            {
                std::lock_guard<std::mutex> lock(execution->mutex);
                execution->aborted = true;
            }
            execution->cv.notify_all();
        }

        retry_timers_.stop();

        size_t aborted = 0;
        for (auto& job : pending) {
            if (job->state.tryAbort()) {
                finish(job, JobStatus::FAILED, ErrorCode::SHUTTING_DOWN, "orchestrator shutting down");
                ++aborted;
            }
        }
        Logger::getInstance().logMessage("Dispatcher: shutting down, failed " + std::to_string(aborted) +
                                         " waiting job(s), abandoned " + std::to_string(running.size()) +
                                         " execution(s)");
    }

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    for (auto& slot : slots_) {
        if (slot.joinable()) {
            slot.join();
        }
    }
}

void Dispatcher::slotLoop(size_t slot) {
    FLOTILLA_DEBUG_LOG("Dispatcher: slot " << slot << " running");
    (void)slot;

    while (true) {
        JobPtr job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }

            job = std::move(queue_.front());
            queue_.pop_front();
            // Lost a race with cancel()
            if (!job->state.tryDispatch()) {
                continue;
            }
            ++in_flight_;
        }

        job->attempts.fetch_add(1);
        runAttempt(job);

        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
}

void Dispatcher::runAttempt(const JobPtr& job) {
    InstanceLease lease;
    try {
        lease = pool_.acquire(pool_.config().acquireTimeout, balancer_.selector(job->strategy),
                              stop_source_.get_token());
    } catch (const PoolError& e) {
        onAttemptFailed(job, e.code(), shortReason(e.what()), e.retryable());
        return;
    }

    job->lastInstanceId = lease.instanceId;
    job->announced.wait(false, std::memory_order_acquire);
    publish(PoolEventType::JOB_DISPATCHED, job, "attempt " + std::to_string(job->attempts.load()));

    auto execution = std::make_shared<Execution>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution->aborted = stopping_;
        executions_[job->id] = execution;
    }

    const auto started = Clock::now();
    const auto deadline = started + job->executionTimeout;

    if (!execution->aborted) {
        try {
            std::thread([execution, backend = lease.backend, payload = job->payload, deadline] {
                std::string output;
                std::exception_ptr error;
                try {
                    output = backend->execute(payload, deadline);
                } catch (...) {
                    // Handed to the slot, which classifies it
                    error = std::current_exception();
                }
                {
                    std::lock_guard<std::mutex> lock(execution->mutex);
                    execution->output = std::move(output);
                    execution->error = error;
                    execution->done = true;
                }
                execution->cv.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                executions_.erase(job->id);
            }
            Logger::getInstance().logError(std::string("Dispatcher: cannot start execution thread: ") + e.what());
            pool_.release(lease.instanceId, ReleaseDisposition::FAILED);
            onAttemptFailed(job, ErrorCode::EXECUTION_ERROR, "could not start execution", true);
            return;
        }
    }

    bool done;
    bool aborted;
    std::string output;
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(execution->mutex);
        execution->cv.wait_until(lock, deadline, [&execution] { return execution->done || execution->aborted; });
        done = execution->done;
        aborted = execution->aborted;
        if (done) {
            output = std::move(execution->output);
            error = execution->error;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executions_.erase(job->id);
    }

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    job->lastLatency = latency;

    if (!done) {
        try {
            lease.backend->cancel();
        } catch (const std::exception& e) {
            Logger::getInstance().logWarning("Dispatcher: cancel on " + lease.instanceId + " failed: " + e.what());
        }
        pool_.release(lease.instanceId, ReleaseDisposition::CANCELLED, latency);

        if (aborted) {
            onAttemptFailed(job, ErrorCode::SHUTTING_DOWN, "orchestrator shutting down", false);
        } else {
            Logger::getInstance().logWarning("Dispatcher: job " + job->id + " timed out after " +
                                             std::to_string(latency.count()) + "ms on " + lease.instanceId);
            onAttemptFailed(job, ErrorCode::EXECUTION_TIMEOUT,
                            "execution timed out after " + std::to_string(job->executionTimeout.count()) + "ms",
                            true);
        }
        return;
    }

    if (!error) {
        pool_.recordExchange(lease.instanceId, job->payload, output);
        pool_.release(lease.instanceId, ReleaseDisposition::COMPLETED, latency);
        if (job->state.tryComplete()) {
            finish(job, JobStatus::COMPLETED, ErrorCode::NONE, {}, std::move(output));
        }
        return;
    }

    ReleaseDisposition disposition = ReleaseDisposition::FAILED;
    ErrorCode code = ErrorCode::EXECUTION_ERROR;
    bool retryable = true;
    std::string reason;
    try {
        std::rethrow_exception(error);
    } catch (const ExecutionError& e) {
        if (e.instanceFault()) {
            disposition = ReleaseDisposition::FAULTED;
        }
        retryable = e.retryable();
        reason = shortReason(e.what());
    } catch (const PoolError& e) {
        code = e.code();
        retryable = e.retryable();
        reason = shortReason(e.what());
    } catch (const std::exception& e) {
        reason = shortReason(e.what());
    } catch (...) {
        reason = "backend raised a non-standard exception";
    }

    // Pool shutdown cancels busy backends; report that, not the side effect
    if (pool_.isShuttingDown()) {
        code = ErrorCode::SHUTTING_DOWN;
        retryable = false;
        reason = "orchestrator shutting down";
    }

    pool_.release(lease.instanceId, disposition, latency);
    Logger::getInstance().logWarning("Dispatcher: job " + job->id + " attempt " +
                                     std::to_string(job->attempts.load()) + "/" +
                                     std::to_string(job->maxAttempts) + " failed on " + lease.instanceId +
                                     ": " + reason);
    onAttemptFailed(job, code, reason, retryable);
}

void Dispatcher::onAttemptFailed(const JobPtr& job, ErrorCode code, const std::string& reason, bool retryable) {
    bool retry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retry = retryable && job->attempts.load() < job->maxAttempts && !stopping_;
        if (retry) {
            if (!job->state.tryBackoff()) {
                return;
            }
            ++retry_count_;
        }
    }

    if (retry) {
        auto delay = config_.retryDelay(job->attempts.load());
        publish(PoolEventType::JOB_RETRYING, job, reason + "; retry in " + std::to_string(delay.count()) + "ms");
        scheduleRetry(job, delay);
        return;
    }

    if (job->state.tryFail()) {
        finish(job, JobStatus::FAILED, code, reason);
    }
}

void Dispatcher::scheduleRetry(const JobPtr& job, std::chrono::milliseconds delay) {
    try {
        auto id = retry_timers_.schedule(delay, [this, job] { requeue(job); });
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->state.getState() == JobStateMachine::State::BACKOFF) {
            job->retryTimer = id;
        }
    } catch (const std::exception& e) {
        Logger::getInstance().logError("Dispatcher: cannot schedule retry of " + job->id + ": " + e.what());
        if (job->state.tryAbort()) {
            finish(job, JobStatus::FAILED, ErrorCode::SHUTTING_DOWN, "retry could not be scheduled");
        }
    }
}

void Dispatcher::requeue(const JobPtr& job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->retryTimer = 0;
        // During shutdown the job is failed by shutdown() instead
        if (stopping_ || !job->state.tryRequeue()) {
            return;
        }
        enqueueLocked(job);
    }
    queue_cv_.notify_one();
}

void Dispatcher::finish(const JobPtr& job, JobStatus status, ErrorCode code, const std::string& reason,
                        std::string output) {
    JobOutcome outcome;
    outcome.jobId = job->id;
    outcome.status = status;
    outcome.output = std::move(output);
    outcome.error = code;
    outcome.reason = reason;
    outcome.attempts = job->attempts.load();
    outcome.instanceId = job->lastInstanceId;
    outcome.latency = job->lastLatency;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.erase(job->id);
        retainLocked(job->id, job->future);

        switch (status) {
        case JobStatus::COMPLETED: {
            ++success_count_;
            ++latency_samples_;
            auto delta = (outcome.latency - average_latency_).count() / static_cast<int64_t>(latency_samples_);
            average_latency_ += std::chrono::milliseconds(delta);
            break;
        }
        case JobStatus::FAILED:
            ++failure_count_;
            break;
        case JobStatus::CANCELLED:
            ++cancelled_count_;
            break;
        }
    }

    PoolEventType type = status == JobStatus::COMPLETED ? PoolEventType::JOB_COMPLETED
                         : status == JobStatus::FAILED  ? PoolEventType::JOB_FAILED
                                                        : PoolEventType::JOB_CANCELLED;
    publish(type, job, reason);

    if (history_) {
        try {
            history_->record(outcome);
        } catch (const std::exception& e) {
            Logger::getInstance().logError("Dispatcher: history sink failed for " + job->id + ": " + e.what());
        }
    }

    job->promise.set_value(std::move(outcome));
}

size_t Dispatcher::enqueueLocked(const JobPtr& job) {
    auto pos = std::find_if(queue_.begin(), queue_.end(),
                            [&job](const JobPtr& queued) { return queued->priority < job->priority; });
    auto it = queue_.insert(pos, job);
    return static_cast<size_t>(it - queue_.begin()) + 1;
}

void Dispatcher::retainLocked(const std::string& jobId, std::shared_future<JobOutcome> future) {
    if (config_.retainedResults == 0) {
        return;
    }
    retained_[jobId] = std::move(future);
    retained_order_.push_back(jobId);
    while (retained_order_.size() > config_.retainedResults) {
        retained_.erase(retained_order_.front());
        retained_order_.pop_front();
    }
}

std::chrono::milliseconds Dispatcher::averageLatencyLocked() const {
    return latency_samples_ == 0 ? config_.defaultLatencyEstimate : average_latency_;
}

void Dispatcher::publish(PoolEventType type, const JobPtr& job, const std::string& detail) {
    if (events_) {
        events_->publish(PoolEvent::job(type, job->id, job->lastInstanceId, detail));
    }
}

} // namespace flotilla
