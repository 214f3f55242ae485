#include "flotilla/timer/TimerRing.hpp"
#include "flotilla/logger/Logger.hpp"
#include <liburing.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace {
class RemoveAckJob final : public flotilla::RingJob {
public:
    void prepareSqe(struct io_uring_sqe*) override {}

    void handleCompletion(flotilla::TimerRing&, struct io_uring_cqe*) override {
        // Completion of a TIMEOUT_REMOVE; the removed timer reports separately.
    }
};

RemoveAckJob g_remove_ack_job;
}

namespace flotilla {

class TimerRing::TimeoutJob final : public RingJob {
public:
    TimeoutJob(TimerId id, std::chrono::milliseconds interval, bool repeating, Callback cb)
        : id_(id), interval_(interval), repeating_(repeating), callback_(std::move(cb)) {}

    void prepareSqe(struct io_uring_sqe* sqe) override {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(interval_);
        ts_.tv_sec = secs.count();
        ts_.tv_nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(interval_ - secs).count();
        io_uring_prep_timeout(sqe, &ts_, 0, 0);
    }

    void handleCompletion(TimerRing& ring, struct io_uring_cqe* cqe) override {
        ring.onTimeout(this, cqe->res);
    }

    TimerId id_;
    std::chrono::milliseconds interval_;
    bool repeating_;
    Callback callback_;
    struct __kernel_timespec ts_{};
    bool armed_ = false;      // an SQE for this job is in the kernel
    bool cancelled_ = false;
};

class TimerRing::WakeJob final : public RingJob {
public:
    explicit WakeJob(int fd) : fd_(fd), counter_buffer_(0) {}

    void prepareSqe(struct io_uring_sqe* sqe) override {
        io_uring_prep_read(sqe, fd_, &counter_buffer_, sizeof(counter_buffer_), 0);
    }

    void handleCompletion(TimerRing& ring, struct io_uring_cqe* cqe) override {
        if (cqe->res < 0) {
            Logger::getInstance().logError("TimerRing[" + ring.getName() + "]: wake read failed: " +
                                           std::string(strerror(-cqe->res)));
            return;
        }
        ring.onWake();
    }

private:
    int fd_;
    uint64_t counter_buffer_;
};

TimerRing::TimerRing(std::string name, unsigned queue_depth)
    : name_(std::move(name)), queue_depth_(queue_depth), ring_{}, ring_ready_(false),
      wake_fd_(), wake_job_(std::make_unique<WakeJob>(wake_fd_.fd())),
      next_id_(1), running_(false) {
}

TimerRing::~TimerRing() {
    stop();
    if (ring_ready_) {
        io_uring_queue_exit(&ring_);
    }
}

void TimerRing::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    if (ring_ready_) {
        throw std::logic_error("TimerRing[" + name_ + "]: cannot restart a stopped ring");
    }

    int ret = io_uring_queue_init(queue_depth_, &ring_, 0);
    if (ret < 0) {
        throw std::runtime_error("TimerRing[" + name_ + "]: Failed to initialize io_uring: " +
                                 std::string(strerror(-ret)));
    }
    ring_ready_ = true;

    struct io_uring_sqe* sqe = acquireSqe();
    wake_job_->prepareSqe(sqe);
    io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(wake_job_.get()));
    io_uring_submit(&ring_);

    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&TimerRing::run, this);

    Logger::getInstance().logDebug("TimerRing[" + name_ + "]: started with queue depth " +
                                   std::to_string(queue_depth_));
}

void TimerRing::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        // Never started or already stopped; still join if a previous stop came from the loop
        if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
            thread_.join();
        }
        return;
    }

    wake_fd_.signal();

    // From a callback the loop exits on its own once the callback returns
    if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
        thread_.join();
    }
}

TimerRing::TimerId TimerRing::schedule(std::chrono::milliseconds delay, Callback cb) {
    return add(delay, false, std::move(cb));
}

TimerRing::TimerId TimerRing::scheduleRepeating(std::chrono::milliseconds interval, Callback cb) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("TimerRing[" + name_ + "]: repeating interval must be positive");
    }
    return add(interval, true, std::move(cb));
}

TimerRing::TimerId TimerRing::add(std::chrono::milliseconds delay, bool repeating, Callback cb) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire)) {
        throw std::logic_error("TimerRing[" + name_ + "]: not running");
    }

    TimerId id = next_id_++;
    auto job = std::make_unique<TimeoutJob>(id, delay, repeating, std::move(cb));
    TimeoutJob* raw = job.get();
    timers_.emplace(id, std::move(job));
    armLocked(raw);
    return id;
}

bool TimerRing::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end() || it->second->cancelled_) {
        return false;
    }

    TimeoutJob* job = it->second.get();
    job->cancelled_ = true;

    if (job->armed_ && ring_ready_) {
        struct io_uring_sqe* sqe = acquireSqe();
        io_uring_prep_timeout_remove(sqe, reinterpret_cast<uintptr_t>(job), 0);
        io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(&g_remove_ack_job));
        io_uring_submit(&ring_);
    }
    // Otherwise the callback is running; onTimeout drops the job afterwards.
    return true;
}

size_t TimerRing::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, job] : timers_) {
        if (!job->cancelled_) {
            ++count;
        }
    }
    return count;
}

struct io_uring_sqe* TimerRing::acquireSqe() {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        // Flush outstanding submissions to free an SQE
        io_uring_submit(&ring_);
        sqe = io_uring_get_sqe(&ring_);
    }
    if (!sqe) {
        throw std::runtime_error("TimerRing[" + name_ + "]: submission queue full");
    }
    return sqe;
}

void TimerRing::armLocked(TimeoutJob* job) {
    struct io_uring_sqe* sqe = acquireSqe();
    job->prepareSqe(sqe);
    io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(job));
    job->armed_ = true;

    int ret = io_uring_submit(&ring_);
    if (ret < 0) {
        job->armed_ = false;
        throw std::runtime_error("TimerRing[" + name_ + "]: io_uring_submit failed: " +
                                 std::string(strerror(-ret)));
    }
}

void TimerRing::run() {
    Logger::getInstance().logDebug("TimerRing[" + name_ + "]: event loop starting");

    while (running_.load(std::memory_order_acquire)) {
        struct io_uring_cqe* cqe;
        int ret = io_uring_wait_cqe(&ring_, &cqe);
        if (ret < 0) {
            if (ret != -EINTR) {
                Logger::getInstance().logError("TimerRing[" + name_ + "]: io_uring_wait_cqe failed: " +
                                               std::string(strerror(-ret)));
            }
            continue;
        }
        processAvailableCompletions();
    }

    // Jobs are only freed here, after the last completion batch referencing them
    size_t dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = timers_.size();
        timers_.clear();
    }
    Logger::getInstance().logDebug("TimerRing[" + name_ + "]: event loop stopped, dropped " +
                                   std::to_string(dropped) + " pending timers");
}

void TimerRing::processAvailableCompletions() {
    // Copy out first: callbacks may submit, and the CQ must be advanced
    // before user code runs for a long time.
    std::vector<std::pair<RingJob*, int>> ready;
    struct io_uring_cqe* cqe;
    unsigned head;
    unsigned handled = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
        auto* job = reinterpret_cast<RingJob*>(io_uring_cqe_get_data64(cqe));
        ready.emplace_back(job, cqe->res);
        ++handled;
    }
    io_uring_cq_advance(&ring_, handled);

    for (auto& [job, res] : ready) {
        if (!job) {
            Logger::getInstance().logError("TimerRing[" + name_ + "]: completion with null user_data");
            continue;
        }
        struct io_uring_cqe copy{};
        copy.res = res;
        job->handleCompletion(*this, &copy);
    }
}

void TimerRing::onTimeout(TimeoutJob* job, int result) {
    Callback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->armed_ = false;

        // -ETIME: expired. -ECANCELED: removed by cancel() or ring teardown.
        bool fired = (result == -ETIME || result == 0);
        if (!fired || job->cancelled_ || !running_.load(std::memory_order_acquire)) {
            timers_.erase(job->id_);
            return;
        }
        callback = job->callback_;
    }

    try {
        callback();
    } catch (const std::exception& e) {
        Logger::getInstance().logError("TimerRing[" + name_ + "]: timer callback threw: " +
                                       std::string(e.what()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!job->repeating_ || job->cancelled_ || !running_.load(std::memory_order_acquire)) {
        timers_.erase(job->id_);
        return;
    }
    try {
        armLocked(job);
    } catch (const std::exception& e) {
        Logger::getInstance().logError("TimerRing[" + name_ + "]: failed to re-arm timer " +
                                       std::to_string(job->id_) + ": " + e.what());
        timers_.erase(job->id_);
    }
}

void TimerRing::onWake() {
    wake_fd_.consume();
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        struct io_uring_sqe* sqe = acquireSqe();
        wake_job_->prepareSqe(sqe);
        io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(wake_job_.get()));
        io_uring_submit(&ring_);
    } catch (const std::exception& e) {
        Logger::getInstance().logError("TimerRing[" + name_ + "]: failed to re-arm wake read: " +
                                       std::string(e.what()));
    }
}

} // namespace flotilla
