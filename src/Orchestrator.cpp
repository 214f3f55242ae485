#include "flotilla/Orchestrator.hpp"
#include "flotilla/Errors.hpp"
#include "flotilla/logger/Logger.hpp"
#include <stdexcept>

namespace flotilla {

Orchestrator::Orchestrator(OrchestratorConfig config, BackendFactory factory, JobHistorySink* history)
    : config_(std::move(config)), factory_(std::move(factory)), history_(history) {
}

Orchestrator::~Orchestrator() {
    shutdown();
}

PoolStats Orchestrator::initialize() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (initialized_.load()) {
        throw std::logic_error("Orchestrator: already initialized");
    }
    if (shut_down_.load()) {
        throw ShuttingDown("Orchestrator: shut down");
    }

    config_.validate();
    if (!factory_) {
        throw std::invalid_argument("Orchestrator: backend factory is required");
    }
    if (config_.logLevel) {
        Logger::getInstance().setLevel(*config_.logLevel);
    }

    pool_ = std::make_unique<PoolManager>(config_.pool, factory_, &events_);
    dispatcher_ = std::make_unique<Dispatcher>(config_.dispatcher, *pool_, &events_, history_);
    stats_ = std::make_unique<StatsAggregator>(*pool_, dispatcher_.get());
    health_ = std::make_unique<HealthMonitor>(*pool_, [this] { return stats_->snapshot(); }, &events_);

    pool_->initialize();
    dispatcher_->start();
    health_->start();
    initialized_.store(true);

    PoolStats snapshot = stats_->snapshot();
    Logger::getInstance().logMessage("Orchestrator: ready, " + formatPoolStats(snapshot));
    return snapshot;
}

SubmitReceipt Orchestrator::submit(std::string payload, std::string callerId, const SubmitOptions& options) {
    requireRunning();
    return dispatcher_->submit(std::move(payload), std::move(callerId), options);
}

std::vector<JobOutcome> Orchestrator::submitBatch(const std::vector<std::string>& payloads,
                                                  const std::string& callerId, const SubmitOptions& options) {
    requireRunning();
    return dispatcher_->submitBatch(payloads, callerId, options);
}

bool Orchestrator::cancel(const std::string& jobId) {
    requireRunning();
    return dispatcher_->cancel(jobId);
}

QueueStatus Orchestrator::queueStatus() const {
    requireRunning();
    return dispatcher_->queueStatus();
}

size_t Orchestrator::remainingRequests(const std::string& callerId) {
    requireRunning();
    return dispatcher_->remainingRequests(callerId);
}

JobOutcome Orchestrator::awaitResult(const std::string& jobId) {
    // Results stay readable after shutdown
    if (!initialized_.load()) {
        throw std::logic_error("Orchestrator: not initialized");
    }
    return dispatcher_->awaitResult(jobId);
}

PoolStats Orchestrator::stats() const {
    if (!initialized_.load()) {
        throw std::logic_error("Orchestrator: not initialized");
    }
    return stats_->snapshot();
}

void Orchestrator::recycle(const std::string& instanceId) {
    requireRunning();
    pool_->recycle(instanceId);
}

HealthReport Orchestrator::checkHealth() {
    requireRunning();
    return health_->runOnce();
}

void Orchestrator::subscribe(PoolObserver& observer) {
    events_.subscribe(observer);
}

void Orchestrator::unsubscribe(PoolObserver& observer) {
    events_.unsubscribe(observer);
}

void Orchestrator::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_.exchange(true)) {
        return;
    }

    if (initialized_.load()) {
        health_->stop();
        pool_->shutdown();
        dispatcher_->shutdown();

        PoolEvent event;
        event.type = PoolEventType::POOL_SHUTDOWN;
        event.timestamp = std::chrono::system_clock::now();
        event.stats = std::make_shared<const PoolStats>(stats_->snapshot());
        events_.publish(std::move(event));
    }
    events_.drain();

    Logger::getInstance().logMessage("Orchestrator: shut down");
}

void Orchestrator::requireRunning() const {
    if (shut_down_.load()) {
        throw ShuttingDown("Orchestrator: shut down");
    }
    if (!initialized_.load()) {
        throw std::logic_error("Orchestrator: not initialized");
    }
}

} // namespace flotilla
