#pragma once

#include "flotilla/events/PoolEvent.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace flotilla {

class PoolObserver {
public:
    virtual ~PoolObserver() = default;

    /**
     * Called on the bus thread. Exceptions are logged and dropped.
     */
    virtual void onPoolEvent(const PoolEvent& event) = 0;
};

/**
 * Ordered fan-out of pool events to observers.
 *
 * publish() only enqueues; a dedicated thread delivers each event exactly
 * once to every observer subscribed at delivery time, in publish order.
 * Events published from inside an observer are delivered inline.
 */
class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Observers must outlive the bus or unsubscribe first.
     */
    void subscribe(PoolObserver& observer);
    void unsubscribe(PoolObserver& observer);

    void publish(PoolEvent event);

    /**
     * Deliver everything already published, then stop the thread. Later
     * publishes are delivered synchronously on the caller's thread.
     */
    void drain();

    uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }

private:
    class Impl;
    std::atomic<uint64_t> delivered_{0};
    std::unique_ptr<Impl> impl_;
};

} // namespace flotilla
