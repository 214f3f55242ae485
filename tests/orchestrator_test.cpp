#include <gtest/gtest.h>
#include "flotilla/Errors.hpp"
#include "flotilla/Orchestrator.hpp"
#include "util/FakeBackend.hpp"
#include <algorithm>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace flotilla;
using namespace flotilla::test;
using namespace std::chrono_literals;

namespace {
class EventRecorder : public PoolObserver {
public:
    void onPoolEvent(const PoolEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        types_.push_back(event.type);
    }
    std::vector<PoolEventType> types() {
        std::lock_guard<std::mutex> lock(mutex_);
        return types_;
    }
    int count(PoolEventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(types_.begin(), types_.end(), type));
    }

private:
    std::mutex mutex_;
    std::vector<PoolEventType> types_;
};

// Calls back into the orchestrator from inside its callbacks
class ReentrantObserver : public PoolObserver {
public:
    explicit ReentrantObserver(Orchestrator& pool) : pool_(pool) {}

    void onPoolEvent(const PoolEvent& event) override {
        if (event.type == PoolEventType::JOB_QUEUED) {
            size_t queue_length = pool_.queueStatus().length;
            size_t pool_size = pool_.stats().poolSize;
            std::lock_guard<std::mutex> lock(mutex_);
            queued_seen_++;
            last_queue_length_ = queue_length;
            last_pool_size_ = pool_size;
        } else if (event.type == PoolEventType::JOB_COMPLETED) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (resubmitted_) {
                    return;
                }
                resubmitted_ = true;
            }
            SubmitReceipt receipt = pool_.submit("follow-up", "observer");
            std::lock_guard<std::mutex> lock(mutex_);
            follow_up_ = receipt.jobId;
        }
    }

    std::string followUp() {
        std::lock_guard<std::mutex> lock(mutex_);
        return follow_up_;
    }
    int queuedSeen() {
        std::lock_guard<std::mutex> lock(mutex_);
        return queued_seen_;
    }
    size_t lastQueueLength() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_queue_length_;
    }
    size_t lastPoolSize() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_pool_size_;
    }

private:
    Orchestrator& pool_;
    std::mutex mutex_;
    bool resubmitted_ = false;
    std::string follow_up_;
    int queued_seen_ = 0;
    size_t last_queue_length_ = 0;
    size_t last_pool_size_ = 0;
};
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.pool.minInstances = 2;
        config_.pool.maxInstances = 3;
        config_.pool.healthCheckInterval = 1h;
        config_.pool.acquireTimeout = 2s;
        config_.dispatcher.concurrency = 3;
        config_.dispatcher.baseRetryDelay = 10ms;
        config_.dispatcher.maxRetryDelay = 50ms;
        config_.dispatcher.executionTimeout = 5s;
    }

    void TearDown() override {
        if (orchestrator_) {
            orchestrator_->shutdown();
        }
        orchestrator_.reset();
    }

    Orchestrator& start() {
        orchestrator_ = std::make_unique<Orchestrator>(config_, factory_.factory());
        orchestrator_->subscribe(recorder_);
        orchestrator_->initialize();
        return *orchestrator_;
    }

    template <typename Pred>
    bool waitUntil(Pred pred, std::chrono::milliseconds limit = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }

    OrchestratorConfig config_;
    FakeBackendFactory factory_;
    EventRecorder recorder_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(OrchestratorTest, InitializeReportsMinimumPool) {
    orchestrator_ = std::make_unique<Orchestrator>(config_, factory_.factory());
    PoolStats stats = orchestrator_->initialize();
    EXPECT_EQ(stats.poolSize, 2u);
    EXPECT_EQ(stats.busyCount, 0u);
    EXPECT_EQ(stats.utilization, 0.0);
    EXPECT_EQ(stats.minInstances, 2u);
    EXPECT_EQ(stats.maxInstances, 3u);
    EXPECT_THROW(orchestrator_->initialize(), std::logic_error);
}

TEST_F(OrchestratorTest, InvalidConfigRejectedOnInitialize) {
    config_.pool.minInstances = 4;
    Orchestrator orchestrator(config_, factory_.factory());
    EXPECT_THROW(orchestrator.initialize(), std::invalid_argument);
    EXPECT_EQ(factory_.createdCount(), 0u);
}

TEST_F(OrchestratorTest, OperationsRequireInitialize) {
    Orchestrator orchestrator(config_, factory_.factory());
    EXPECT_THROW(orchestrator.submit("x", "alice"), std::logic_error);
    EXPECT_THROW(orchestrator.stats(), std::logic_error);
}

TEST_F(OrchestratorTest, IndependentPoolsDoNotShareInstances) {
    FakeBackendFactory other_factory;
    Orchestrator other(config_, other_factory.factory());
    other.initialize();
    Orchestrator& mine = start();

    auto a = mine.awaitResult(mine.submit("a", "alice").jobId);
    auto b = other.awaitResult(other.submit("b", "alice").jobId);
    EXPECT_NE(factory_.find(a.instanceId), nullptr);
    EXPECT_EQ(factory_.find(b.instanceId), nullptr);
    EXPECT_NE(other_factory.find(b.instanceId), nullptr);
    other.shutdown();
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(OrchestratorTest, BurstRunsUpToConcurrencyAndQueuesTheRest) {
    Orchestrator& pool = start();
    factory_.behavior->latencyMs = 200;

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(pool.submit("job " + std::to_string(i), "alice").jobId);
    }

    ASSERT_TRUE(waitUntil([&] { return pool.queueStatus().inFlight == 3; }, 150ms));
    QueueStatus status = pool.queueStatus();
    EXPECT_EQ(status.inFlight, 3u);
    EXPECT_EQ(status.length, 2u);

    for (const auto& id : ids) {
        EXPECT_TRUE(pool.awaitResult(id).ok());
    }
    PoolStats stats = pool.stats();
    EXPECT_EQ(stats.successCount, 5u);
    EXPECT_EQ(stats.failureCount, 0u);
    EXPECT_LE(stats.poolSize, 3u);
    EXPECT_GE(stats.poolSize, 2u);
}

TEST_F(OrchestratorTest, IdleProbeFailureRestoresMinimum) {
    Orchestrator& pool = start();
    auto before = pool.stats();
    factory_.find(before.instances[0].id)->probeOk = false;

    HealthReport report = pool.checkHealth();
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.stats.poolSize, 2u);
    EXPECT_EQ(report.stats.recycledCount, 1u);
    EXPECT_EQ(pool.stats().healthyCount, 2u);
}

TEST_F(OrchestratorTest, PeriodicHealthCheckRecyclesDeadInstance) {
    config_.pool.healthCheckInterval = 30ms;
    Orchestrator& pool = start();
    std::string victim = pool.stats().instances[0].id;
    factory_.find(victim)->probeOk = false;

    ASSERT_TRUE(waitUntil([&] { return pool.stats().recycledCount >= 1; }));
    PoolStats stats = pool.stats();
    EXPECT_EQ(stats.poolSize, 2u);
    for (const auto& instance : stats.instances) {
        EXPECT_NE(instance.id, victim);
    }
}

TEST_F(OrchestratorTest, RateLimitedJobsAreNeverEnqueued) {
    config_.dispatcher.rateLimit.maxRequests = 5;
    config_.dispatcher.rateLimit.window = 1h;
    Orchestrator& pool = start();

    for (int i = 1; i <= 10; ++i) {
        if (i <= 5) {
            EXPECT_NO_THROW(pool.submit("job " + std::to_string(i), "alice"));
        } else {
            EXPECT_THROW(pool.submit("job " + std::to_string(i), "alice"), RateLimitExceeded);
        }
    }
    EXPECT_EQ(pool.stats().totalRequests, 5u);
    EXPECT_EQ(pool.remainingRequests("alice"), 0u);
}

TEST_F(OrchestratorTest, RoundRobinVisitsEachInstanceOnce) {
    config_.pool.minInstances = 3;
    config_.dispatcher.concurrency = 1;
    config_.dispatcher.strategy = Strategy::ROUND_ROBIN;
    Orchestrator& pool = start();

    std::set<std::string> visited;
    for (int i = 0; i < 3; ++i) {
        visited.insert(pool.awaitResult(pool.submit("rr", "alice").jobId).instanceId);
    }
    EXPECT_EQ(visited.size(), 3u);
}

TEST_F(OrchestratorTest, ExhaustedJobFailsTerminally) {
    config_.dispatcher.maxAttempts = 2;
    Orchestrator& pool = start();
    factory_.behavior->failuresRemaining = 1000;

    JobOutcome outcome = pool.awaitResult(pool.submit("doomed", "alice").jobId);
    EXPECT_EQ(outcome.status, JobStatus::FAILED);
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(outcome.reason.find('\n'), std::string::npos);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(pool.stats().retryCount, 1u);
    EXPECT_EQ(pool.stats().failureCount, 1u);
}

TEST_F(OrchestratorTest, WornOutInstanceIsNeverReturned) {
    config_.pool.minInstances = 1;
    config_.pool.maxInstances = 1;
    config_.pool.maxMessagesPerInstance = 2;
    config_.dispatcher.concurrency = 1;
    Orchestrator& pool = start();

    std::vector<std::string> used;
    for (int i = 0; i < 4; ++i) {
        used.push_back(pool.awaitResult(pool.submit("work", "alice").jobId).instanceId);
    }
    EXPECT_EQ(used[0], used[1]);
    EXPECT_EQ(used[1], used[2]);
    EXPECT_NE(used[3], used[0]);
    EXPECT_EQ(pool.stats().recycledCount, 1u);
}

TEST_F(OrchestratorTest, ManualRecycle) {
    Orchestrator& pool = start();
    std::string id = pool.stats().instances[0].id;
    pool.recycle(id);
    EXPECT_EQ(pool.stats().poolSize, 2u);
    EXPECT_THROW(pool.recycle(id), NotFound);
}

TEST_F(OrchestratorTest, BatchSubmission) {
    Orchestrator& pool = start();
    auto results = pool.submitBatch({"a", "b", "c", "d"}, "alice");
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.ok()) << r.reason;
    }
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(OrchestratorTest, ShutdownFailsOutstandingJobsAndRejectsNewOnes) {
    config_.dispatcher.concurrency = 1;
    Orchestrator& pool = start();
    factory_.behavior->latencyMs = 5000;

    auto running = pool.submit("running", "alice");
    ASSERT_TRUE(waitUntil([&] { return pool.queueStatus().inFlight == 1; }));
    auto waiting = pool.submit("waiting", "alice");

    auto started = std::chrono::steady_clock::now();
    pool.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    JobOutcome a = pool.awaitResult(running.jobId);
    JobOutcome b = pool.awaitResult(waiting.jobId);
    EXPECT_EQ(a.status, JobStatus::FAILED);
    EXPECT_EQ(a.error, ErrorCode::SHUTTING_DOWN);
    EXPECT_EQ(b.status, JobStatus::FAILED);
    EXPECT_EQ(b.error, ErrorCode::SHUTTING_DOWN);

    EXPECT_THROW(pool.submit("late", "alice"), ShuttingDown);
    EXPECT_NO_THROW(pool.shutdown());

    for (const auto& backend : factory_.created()) {
        EXPECT_EQ(backend->disposes.load(), 1);
    }

    auto types = recorder_.types();
    ASSERT_FALSE(types.empty());
    EXPECT_EQ(types.back(), PoolEventType::POOL_SHUTDOWN);
}

TEST_F(OrchestratorTest, ObserverMayCallBackIntoOrchestrator) {
    config_.pool.minInstances = 1;
    config_.pool.maxInstances = 1;
    config_.dispatcher.concurrency = 1;
    Orchestrator& pool = start();
    ReentrantObserver observer(pool);
    pool.subscribe(observer);

    ASSERT_TRUE(pool.awaitResult(pool.submit("first", "alice").jobId).ok());
    ASSERT_TRUE(waitUntil([&] { return !observer.followUp().empty(); }));

    JobOutcome follow_up = pool.awaitResult(observer.followUp());
    EXPECT_TRUE(follow_up.ok()) << follow_up.reason;
    EXPECT_EQ(follow_up.output, follow_up.instanceId + ":follow-up");
    EXPECT_TRUE(waitUntil([&] { return observer.queuedSeen() == 2; }));
    EXPECT_EQ(observer.lastPoolSize(), 1u);
    EXPECT_LE(observer.lastQueueLength(), 1u);

    // JobQueued still precedes JobDispatched for the job submitted from the bus thread
    ASSERT_TRUE(waitUntil([&] { return recorder_.count(PoolEventType::JOB_DISPATCHED) == 2; }));
    auto types = recorder_.types();
    auto queued = std::find(types.begin(), types.end(), PoolEventType::JOB_QUEUED);
    ASSERT_NE(queued, types.end());
    auto second_queued = std::find(queued + 1, types.end(), PoolEventType::JOB_QUEUED);
    ASSERT_NE(second_queued, types.end());
    EXPECT_NE(std::find(second_queued, types.end(), PoolEventType::JOB_DISPATCHED), types.end());

    pool.unsubscribe(observer);
}

TEST_F(OrchestratorTest, ObserversSeeInstanceAndJobEvents) {
    Orchestrator& pool = start();
    pool.awaitResult(pool.submit("observed", "alice").jobId);
    pool.shutdown();

    EXPECT_EQ(recorder_.count(PoolEventType::INSTANCE_CREATED), 2);
    EXPECT_EQ(recorder_.count(PoolEventType::JOB_QUEUED), 1);
    EXPECT_EQ(recorder_.count(PoolEventType::JOB_DISPATCHED), 1);
    EXPECT_EQ(recorder_.count(PoolEventType::JOB_COMPLETED), 1);
    EXPECT_EQ(recorder_.count(PoolEventType::INSTANCE_RECYCLED), 2);
}
