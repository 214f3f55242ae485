#pragma once

#include "flotilla/timer/RingJob.hpp"
#include "flotilla/util/EventFd.hpp"
#include <liburing.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace flotilla {

/**
 * TimerRing: io_uring event loop on a dedicated thread that fires callbacks.
 *
 * Each timer is an IORING_OP_TIMEOUT whose user_data points at its job;
 * cancel() submits IORING_OP_TIMEOUT_REMOVE. A persistent read on an
 * eventfd lets stop() wake the loop while it is blocked in io_uring_wait_cqe.
 *
 * schedule()/cancel() may be called from any thread, including from inside
 * a callback. Callbacks run on the ring thread one at a time and should be
 * short; components with slow periodic work own a ring of their own.
 *
 * Usage:
 *   TimerRing ring("health");
 *   ring.start();
 *   auto id = ring.scheduleRepeating(std::chrono::seconds(30), [] { ... });
 *   ring.cancel(id);
 *   ring.stop();
 */
class TimerRing {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    /**
     * @param name Used in log lines
     * @param queue_depth io_uring queue depth
     */
    explicit TimerRing(std::string name, unsigned queue_depth = 256);
    ~TimerRing();

    TimerRing(const TimerRing&) = delete;
    TimerRing& operator=(const TimerRing&) = delete;

    /**
     * Initialize the ring and start the loop thread.
     * @throws std::runtime_error if io_uring cannot be set up
     */
    void start();

    /**
     * Stop the loop and join its thread. Timers that have not fired are
     * dropped without running. Safe to call more than once.
     */
    void stop();

    /**
     * Run `cb` once after `delay`.
     * @throws std::logic_error if the ring is not running
     */
    TimerId schedule(std::chrono::milliseconds delay, Callback cb);

    /**
     * Run `cb` every `interval` until cancelled. The next period starts when
     * the callback returns, so slow callbacks never overlap.
     */
    TimerId scheduleRepeating(std::chrono::milliseconds interval, Callback cb);

    /**
     * @return true if the timer was pending and will not fire again
     */
    bool cancel(TimerId id);

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    size_t pending() const;

    const std::string& getName() const { return name_; }

private:
    class TimeoutJob;
    class WakeJob;
    friend class TimeoutJob;
    friend class WakeJob;

    TimerId add(std::chrono::milliseconds delay, bool repeating, Callback cb);
    void run();
    void processAvailableCompletions();

    // Require mutex_ held
    struct io_uring_sqe* acquireSqe();
    void armLocked(TimeoutJob* job);

    void onTimeout(TimeoutJob* job, int result);
    void onWake();

    std::string name_;
    unsigned queue_depth_;
    struct io_uring ring_;
    bool ring_ready_;

    EventFd wake_fd_;
    std::unique_ptr<WakeJob> wake_job_;

    mutable std::mutex mutex_;  // guards the SQ and timers_
    std::unordered_map<TimerId, std::unique_ptr<TimeoutJob>> timers_;
    TimerId next_id_;

    std::atomic<bool> running_;
    std::thread thread_;
};

} // namespace flotilla
