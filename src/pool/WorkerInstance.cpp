#include "flotilla/pool/WorkerInstance.hpp"
#include <stdexcept>

namespace flotilla {

const char* releaseDispositionName(ReleaseDisposition disposition) {
    switch (disposition) {
    case ReleaseDisposition::COMPLETED: return "completed";
    case ReleaseDisposition::FAILED: return "failed";
    case ReleaseDisposition::FAULTED: return "faulted";
    case ReleaseDisposition::CANCELLED: return "cancelled";
    }
    return "unknown";
}

WorkerInstance::WorkerInstance(std::string id, std::shared_ptr<WorkerBackend> backend,
                               Clock::time_point now)
    : id_(std::move(id)), backend_(std::move(backend)), created_at_(now), last_used_at_(now) {
    if (!backend_) {
        throw std::invalid_argument("WorkerInstance: null backend for " + id_);
    }
    unsigned w = backend_->weight();
    weight_ = w == 0 ? 1 : w;
}

bool WorkerInstance::dueForRecycle(const PoolConfig& config, Clock::time_point now) const {
    return message_count_ > config.maxMessagesPerInstance ||
           now - created_at_ > config.maxInstanceAge ||
           !healthy();
}

bool WorkerInstance::stale(const PoolConfig& config, Clock::time_point now) const {
    return !busy_ && now - last_used_at_ > config.staleTimeout;
}

void WorkerInstance::markAcquired(Clock::time_point now) {
    if (busy_) {
        throw std::logic_error("WorkerInstance: " + id_ + " acquired while busy");
    }
    busy_ = true;
    ++current_load_;
    last_used_at_ = now;
}

void WorkerInstance::markReleased(ReleaseDisposition disposition, std::chrono::milliseconds latency,
                                  Clock::time_point now) {
    busy_ = false;
    if (current_load_ > 0) {
        --current_load_;
    }
    ++message_count_;
    last_used_at_ = now;

    switch (disposition) {
    case ReleaseDisposition::COMPLETED: {
        ++completed_count_;
        // Running mean, integer milliseconds
        auto delta = (latency - average_response_time_).count() / static_cast<int64_t>(completed_count_);
        average_response_time_ += std::chrono::milliseconds(delta);
        break;
    }
    case ReleaseDisposition::FAILED:
        ++failure_count_;
        break;
    case ReleaseDisposition::FAULTED:
    case ReleaseDisposition::CANCELLED:
        ++failure_count_;
        health_ = InstanceHealth::UNHEALTHY;
        break;
    }
}

void WorkerInstance::endProbe(bool ok) {
    probing_ = false;
    if (!ok) {
        health_ = InstanceHealth::UNHEALTHY;
    }
}

void WorkerInstance::recordExchange(const std::string& input, const std::string& output) {
    conversation_.push_back({"user", input});
    conversation_.push_back({"assistant", output});
}

InstanceStats WorkerInstance::snapshot(Clock::time_point now) const {
    InstanceStats stats;
    stats.id = id_;
    stats.busy = busy_;
    stats.healthy = healthy();
    stats.messageCount = message_count_;
    stats.currentLoad = current_load_;
    stats.weight = weight_;
    stats.averageResponseTime = average_response_time_;
    stats.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at_);
    stats.idleFor = busy_ ? std::chrono::milliseconds(0)
                          : std::chrono::duration_cast<std::chrono::milliseconds>(now - last_used_at_);
    stats.conversationLength = conversation_.size();
    return stats;
}

} // namespace flotilla
