#pragma once

#include "flotilla/stats/PoolStats.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace flotilla {

enum class PoolEventType : uint8_t {
    INSTANCE_CREATED,
    INSTANCE_RECYCLED,
    JOB_QUEUED,
    JOB_DISPATCHED,
    JOB_COMPLETED,
    JOB_FAILED,
    JOB_RETRYING,
    JOB_CANCELLED,
    HEALTH_CHECK_COMPLETED,
    POOL_SHUTDOWN
};

const char* poolEventTypeName(PoolEventType type);

struct PoolEvent {
    PoolEventType type = PoolEventType::INSTANCE_CREATED;
    std::chrono::system_clock::time_point timestamp;
    std::string instanceId;   // empty when not about an instance
    std::string jobId;        // empty when not about a job
    std::string detail;       // short reason or note
    std::shared_ptr<const PoolStats> stats;  // HEALTH_CHECK_COMPLETED only

    static PoolEvent instance(PoolEventType type, std::string instance_id, std::string detail = {});
    static PoolEvent job(PoolEventType type, std::string job_id, std::string instance_id = {},
                         std::string detail = {});
};

} // namespace flotilla
