#pragma once

#include "flotilla/Errors.hpp"
#include "flotilla/pool/WorkerBackend.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace flotilla::test {

/**
 * Knobs shared by every backend a FakeBackendFactory creates, so a test can
 * change behaviour for the whole pool at once.
 */
struct FakeBehavior {
    std::atomic<int64_t> latencyMs{0};
    std::atomic<int> failuresRemaining{0};   // next N executions throw
    std::atomic<bool> failTerminal{false};
    std::atomic<bool> failInstanceFault{false};
    std::atomic<bool> ignoreCancel{false};   // simulate a hung worker
    std::atomic<bool> probeOk{true};
    std::atomic<bool> probeThrows{false};
    std::atomic<unsigned> weight{1};
};

class FakeBackend : public WorkerBackend {
public:
    FakeBackend(std::string id, std::shared_ptr<FakeBehavior> behavior)
        : id_(std::move(id)), behavior_(std::move(behavior)) {}

    std::string execute(const std::string& input, Clock::time_point) override {
        executions++;
        inFlight++;
        struct Leave {
            FakeBackend& backend;
            ~Leave() {
                backend.inFlight--;
                backend.returned++;
            }
        } leave{*this};

        int64_t latency = behavior_->latencyMs.load();
        if (latency > 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            auto until = Clock::now() + std::chrono::milliseconds(latency);
            cv_.wait_until(lock, until, [this] {
                return cancelled_ && !behavior_->ignoreCancel.load();
            });
            if (cancelled_ && !behavior_->ignoreCancel.load()) {
                cancelled_ = false;
                throw ExecutionError("fake backend " + id_ + " cancelled");
            }
        }

        int remaining = behavior_->failuresRemaining.load();
        while (remaining > 0) {
            if (behavior_->failuresRemaining.compare_exchange_weak(remaining, remaining - 1)) {
                throw ExecutionError("fake backend " + id_ + " failed", behavior_->failTerminal.load(),
                                     behavior_->failInstanceFault.load());
            }
        }
        return id_ + ":" + input;
    }

    bool probe() override {
        probes++;
        if (behavior_->probeThrows.load()) {
            throw std::runtime_error("probe exploded");
        }
        return behavior_->probeOk.load() && probeOk.load();
    }

    void dispose() override {
        disposes++;
        if (inFlight.load() > 0) {
            disposedWhileExecuting++;
        }
    }

    void cancel() override {
        cancels++;
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    unsigned weight() const override { return behavior_->weight.load(); }

    const std::string& id() const { return id_; }

    std::atomic<int> executions{0};
    std::atomic<int> probes{0};
    std::atomic<int> disposes{0};
    std::atomic<int> cancels{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> returned{0};
    std::atomic<int> disposedWhileExecuting{0};
    std::atomic<bool> probeOk{true};   // per-instance override

private:
    std::string id_;
    std::shared_ptr<FakeBehavior> behavior_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

/**
 * Records every backend it creates. Must outlive the pool using it.
 */
class FakeBackendFactory {
public:
    FakeBackendFactory() : behavior(std::make_shared<FakeBehavior>()) {}

    BackendFactory factory() {
        return [this](const std::string& id) -> std::shared_ptr<WorkerBackend> {
            if (failCreates.load() > 0) {
                failCreates--;
                throw std::runtime_error("provisioning refused");
            }
            auto backend = std::make_shared<FakeBackend>(id, behavior);
            std::lock_guard<std::mutex> lock(mutex_);
            created_.push_back(backend);
            return backend;
        };
    }

    std::shared_ptr<FakeBackend> find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& backend : created_) {
            if (backend->id() == id) {
                return backend;
            }
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<FakeBackend>> created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

    size_t createdCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.size();
    }

    std::shared_ptr<FakeBehavior> behavior;
    std::atomic<int> failCreates{0};

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeBackend>> created_;
};

} // namespace flotilla::test
