/**
 * Pool demo
 *
 * Runs a burst of jobs through an Orchestrator backed by simulated workers
 * that sleep for a random latency and occasionally fail.
 *
 * Usage: ./pool_demo [jobs] [log_file]
 *
 * Pool settings come from FLOTILLA_* environment variables, e.g.
 *   FLOTILLA_MAX_INSTANCES=4 FLOTILLA_STRATEGY=response-time ./pool_demo 40
 */

#include "flotilla/Errors.hpp"
#include "flotilla/Orchestrator.hpp"
#include "flotilla/logger/AsyncLogger.hpp"
#include "flotilla/logger/ConsoleLogger.hpp"
#include "flotilla/logger/FileLogger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <pthread.h>
#include <random>
#include <signal.h>
#include <thread>

using namespace flotilla;

namespace {

class SimulatedBackend : public WorkerBackend {
public:
    SimulatedBackend(std::string id, unsigned weight)
        : id_(std::move(id)), weight_(weight), engine_(std::random_device{}()) {}

    std::string execute(const std::string& input, Clock::time_point deadline) override {
        std::chrono::milliseconds latency;
        bool fail;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latency = std::chrono::milliseconds(std::uniform_int_distribution<int>(20, 250)(engine_));
            fail = std::uniform_int_distribution<int>(0, 9)(engine_) == 0;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        auto until = std::min(Clock::now() + latency, deadline);
        if (cv_.wait_until(lock, until, [this] { return cancelled_; })) {
            cancelled_ = false;
            throw ExecutionError(id_ + ": interrupted");
        }
        if (fail) {
            throw ExecutionError(id_ + ": simulated downstream error");
        }
        return "[" + id_ + "] echo: " + input;
    }

    bool probe() override { return true; }

    void dispose() override {}

    void cancel() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    unsigned weight() const override { return weight_; }

private:
    std::string id_;
    unsigned weight_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::mt19937 engine_;
    bool cancelled_ = false;
};

class ConsoleObserver : public PoolObserver {
public:
    void onPoolEvent(const PoolEvent& event) override {
        switch (event.type) {
        case PoolEventType::INSTANCE_CREATED:
        case PoolEventType::INSTANCE_RECYCLED:
        case PoolEventType::JOB_RETRYING:
            std::cout << poolEventTypeName(event.type) << " " << event.instanceId << " " << event.jobId << " "
                      << event.detail << "\n";
            break;
        case PoolEventType::HEALTH_CHECK_COMPLETED:
        case PoolEventType::POOL_SHUTDOWN:
            if (event.stats) {
                std::cout << poolEventTypeName(event.type) << ": " << formatPoolStats(*event.stats) << "\n";
            }
            break;
        default:
            break;
        }
    }
};

} // namespace

int main(int argc, char** argv) {
    try {
        // Usage: ./pool_demo [jobs] [log_file]
        int job_count = argc > 1 ? std::stoi(argv[1]) : 20;
        std::string log_file = argc > 2 ? argv[2] : "";

        std::unique_ptr<Logger> sink;
        if (log_file.empty()) {
            sink = std::make_unique<ConsoleLogger>();
        } else {
            sink = std::make_unique<FileLogger>(log_file, false);
        }
        AsyncLogger async_logger(std::move(sink));
        Logger::setGlobalLogger(&async_logger);

        OrchestratorConfig config = OrchestratorConfig::fromEnvironment();
        std::cout << "Starting pool demo: " << job_count << " jobs, " << config.pool.minInstances << "-"
                  << config.pool.maxInstances << " instances, strategy "
                  << strategyName(config.dispatcher.strategy) << "\n";

        std::atomic<unsigned> next_weight{1};
        BackendFactory factory = [&next_weight](const std::string& id) {
            unsigned weight = next_weight.fetch_add(1) % 3 + 1;
            return std::make_shared<SimulatedBackend>(id, weight);
        };

        LoggingJobHistorySink history;
        Orchestrator orchestrator(config, factory, &history);
        ConsoleObserver observer;
        orchestrator.subscribe(observer);
        orchestrator.initialize();

        // Block signals in main thread and let a watcher thread shut the pool down
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::thread([&orchestrator, set]() {
            int sig = 0;
            if (sigwait(&set, &sig) == 0) {
                std::cout << "Signal " << sig << " received, shutting down\n";
                orchestrator.shutdown();
            }
        }).detach();

        std::vector<std::string> ids;
        for (int i = 0; i < job_count; ++i) {
            SubmitOptions options;
            options.priority = i % 4 == 0 ? 1 : 0;
            try {
                SubmitReceipt receipt = orchestrator.submit("prompt #" + std::to_string(i), "demo", options);
                ids.push_back(receipt.jobId);
            } catch (const PoolError& e) {
                std::cout << "submit " << i << " rejected: " << e.what() << "\n";
            }
        }

        size_t ok = 0;
        for (const auto& id : ids) {
            JobOutcome outcome = orchestrator.awaitResult(id);
            if (outcome.ok()) {
                ++ok;
            } else {
                std::cout << id << " " << jobStatusName(outcome.status) << ": " << outcome.reason << "\n";
            }
        }

        std::cout << ok << "/" << ids.size() << " jobs completed\n";
        std::cout << formatPoolStats(orchestrator.stats()) << "\n";

        orchestrator.shutdown();
        orchestrator.unsubscribe(observer);
        Logger::setGlobalLogger(nullptr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
