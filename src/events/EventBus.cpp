#include "flotilla/events/EventBus.hpp"
#include "flotilla/logger/Logger.hpp"
#include "../ring_buffer/NotifyingRingBuffer.hpp"
#include <algorithm>

namespace flotilla {

const char* poolEventTypeName(PoolEventType type) {
    switch (type) {
    case PoolEventType::INSTANCE_CREATED: return "InstanceCreated";
    case PoolEventType::INSTANCE_RECYCLED: return "InstanceRecycled";
    case PoolEventType::JOB_QUEUED: return "JobQueued";
    case PoolEventType::JOB_DISPATCHED: return "JobDispatched";
    case PoolEventType::JOB_COMPLETED: return "JobCompleted";
    case PoolEventType::JOB_FAILED: return "JobFailed";
    case PoolEventType::JOB_RETRYING: return "JobRetrying";
    case PoolEventType::JOB_CANCELLED: return "JobCancelled";
    case PoolEventType::HEALTH_CHECK_COMPLETED: return "HealthCheckCompleted";
    case PoolEventType::POOL_SHUTDOWN: return "PoolShutdown";
    }
    return "Unknown";
}

PoolEvent PoolEvent::instance(PoolEventType type, std::string instance_id, std::string detail) {
    PoolEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.instanceId = std::move(instance_id);
    event.detail = std::move(detail);
    return event;
}

PoolEvent PoolEvent::job(PoolEventType type, std::string job_id, std::string instance_id,
                         std::string detail) {
    PoolEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.jobId = std::move(job_id);
    event.instanceId = std::move(instance_id);
    event.detail = std::move(detail);
    return event;
}

namespace {
thread_local const void* t_delivering_bus = nullptr;
}

class EventBus::Impl {
public:
    explicit Impl(EventBus& owner)
        : owner_(owner), running_(true), thread_(&Impl::deliveryThreadFunc, this) {}

    ~Impl() { drain(); }

    void subscribe(PoolObserver& observer) {
        std::lock_guard<std::recursive_mutex> lock(delivery_mutex_);
        if (std::find(observers_.begin(), observers_.end(), &observer) == observers_.end()) {
            observers_.push_back(&observer);
        }
    }

    void unsubscribe(PoolObserver& observer) {
        // Waits out an in-progress delivery so the observer can be destroyed afterwards
        std::lock_guard<std::recursive_mutex> lock(delivery_mutex_);
        observers_.erase(std::remove(observers_.begin(), observers_.end(), &observer), observers_.end());
    }

    void publish(PoolEvent event) {
        if (t_delivering_bus == this) {
            deliver(event);
            return;
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        while (running_) {
            if (ring_.enqueue(std::move(event))) {
                return;
            }
            // Full: wait for the bus thread rather than reorder
            lock.unlock();
            std::this_thread::yield();
            lock.lock();
        }
        lock.unlock();
        deliver(event);
    }

    void drain() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            running_ = false;
        }
        ring_.shutdown();

        // From an observer the thread finishes on its own; the destructor joins it
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (thread_.joinable() && t_delivering_bus != this) {
            thread_.join();
        }
    }

private:
    void deliveryThreadFunc() {
        t_delivering_bus = this;
        PoolEvent event;
        while (ring_.dequeue(event)) {
            deliver(event);
        }

        // Everything accepted before drain() is still delivered
        while (ring_.tryDequeue(event)) {
            deliver(event);
        }
    }

    void deliver(const PoolEvent& event) {
        std::lock_guard<std::recursive_mutex> lock(delivery_mutex_);
        // Observers may (un)subscribe from inside the callback
        std::vector<PoolObserver*> targets = observers_;
        for (PoolObserver* observer : targets) {
            try {
                observer->onPoolEvent(event);
            } catch (const std::exception& e) {
                Logger::getInstance().logError(std::string("EventBus: observer threw on ") +
                                               poolEventTypeName(event.type) + ": " + e.what());
            }
        }
        owner_.delivered_.fetch_add(1, std::memory_order_relaxed);
    }

    EventBus& owner_;
    std::recursive_mutex delivery_mutex_;  // serializes delivery, guards observers_
    std::vector<PoolObserver*> observers_;

    std::mutex join_mutex_;
    std::mutex state_mutex_;  // orders enqueues against drain()
    bool running_;
    NotifyingRingBuffer<PoolEvent, 1024> ring_;
    std::thread thread_;
};

EventBus::EventBus() : impl_(std::make_unique<Impl>(*this)) {}

EventBus::~EventBus() = default;

void EventBus::subscribe(PoolObserver& observer) { impl_->subscribe(observer); }

void EventBus::unsubscribe(PoolObserver& observer) { impl_->unsubscribe(observer); }

void EventBus::publish(PoolEvent event) { impl_->publish(std::move(event)); }

void EventBus::drain() { impl_->drain(); }

} // namespace flotilla
