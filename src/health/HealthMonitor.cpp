#include "flotilla/health/HealthMonitor.hpp"
#include "flotilla/events/EventBus.hpp"
#include "flotilla/logger/Logger.hpp"
#include <memory>

namespace flotilla {

HealthMonitor::HealthMonitor(PoolManager& pool, StatsProvider stats, EventBus* events)
    : pool_(pool), stats_(std::move(stats)), events_(events), timer_("health") {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    timer_.start();
    auto interval = pool_.config().healthCheckInterval;
    timer_id_ = timer_.scheduleRepeating(interval, [this] {
        try {
            runOnce();
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("HealthMonitor: pass failed: ") + e.what());
        }
    });
    Logger::getInstance().logMessage("HealthMonitor: checking every " + std::to_string(interval.count()) + "ms");
}

void HealthMonitor::stop() {
    if (timer_.isRunning()) {
        timer_.cancel(timer_id_);
        // Joins the ring thread, so an in-progress pass completes first
        timer_.stop();
    }
}

HealthReport HealthMonitor::runOnce() {
    std::lock_guard<std::mutex> lock(pass_mutex_);
    HealthReport report;

    if (pool_.isShuttingDown()) {
        return report;
    }

    for (const auto& id : pool_.idleInstanceIds()) {
        if (pool_.recycleIfStale(id)) {
            ++report.stale;
            continue;
        }
        switch (pool_.probeInstance(id)) {
        case ProbeResult::HEALTHY:
            ++report.probed;
            break;
        case ProbeResult::FAILED:
            ++report.probed;
            ++report.failed;
            break;
        case ProbeResult::SKIPPED:
            break;
        }
    }

    report.replenished = pool_.replenish();
    report.stats = stats_ ? stats_() : PoolStats{};
    ++passes_;

    std::string summary = "probed=" + std::to_string(report.probed) + " failed=" + std::to_string(report.failed) +
                          " stale=" + std::to_string(report.stale) +
                          " replenished=" + std::to_string(report.replenished);
    if (report.failed > 0 || report.stale > 0) {
        Logger::getInstance().logMessage("HealthMonitor: " + summary + " | " + formatPoolStats(report.stats));
    } else {
        Logger::getInstance().logDebug("HealthMonitor: " + summary + " | " + formatPoolStats(report.stats));
    }

    if (events_) {
        PoolEvent event;
        event.type = PoolEventType::HEALTH_CHECK_COMPLETED;
        event.timestamp = std::chrono::system_clock::now();
        event.detail = summary;
        event.stats = std::make_shared<const PoolStats>(report.stats);
        events_->publish(std::move(event));
    }
    return report;
}

uint64_t HealthMonitor::passes() const {
    std::lock_guard<std::mutex> lock(pass_mutex_);
    return passes_;
}

} // namespace flotilla
