#pragma once

#include "flotilla/Errors.hpp"
#include "flotilla/balancer/LoadBalancer.hpp"
#include "flotilla/util/JobStateMachine.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flotilla {

enum class JobStatus : uint8_t { COMPLETED, FAILED, CANCELLED };

const char* jobStatusName(JobStatus status);

/**
 * Terminal result of a job, delivered exactly once through its future.
 */
struct JobOutcome {
    std::string jobId;
    JobStatus status = JobStatus::FAILED;
    std::string output;                 // COMPLETED only
    ErrorCode error = ErrorCode::NONE;
    std::string reason;                 // short, single line
    unsigned attempts = 0;
    std::string instanceId;             // last instance the job ran on
    std::chrono::milliseconds latency{0};  // last execution

    bool ok() const { return status == JobStatus::COMPLETED; }
};

struct SubmitOptions {
    int priority = 0;                   // higher runs first, FIFO within a priority
    std::optional<unsigned> maxAttempts;
    std::optional<Strategy> strategy;
    std::optional<std::chrono::milliseconds> executionTimeout;
};

struct SubmitReceipt {
    std::string jobId;
    size_t queuePosition = 0;           // 1-based
    std::chrono::milliseconds estimatedWait{0};
};

struct QueuedJobInfo {
    std::string jobId;
    std::string callerId;
    int priority = 0;
    size_t position = 0;
    unsigned attempts = 0;
    std::chrono::milliseconds age{0};
};

struct QueueStatus {
    size_t length = 0;
    size_t backingOff = 0;
    size_t inFlight = 0;
    std::vector<QueuedJobInfo> jobs;    // queue order
};

struct DispatchCounters {
    uint64_t totalRequests = 0;
    uint64_t successCount = 0;
    uint64_t failureCount = 0;
    uint64_t cancelledCount = 0;
    uint64_t retryCount = 0;
    std::chrono::milliseconds averageLatency{0};
    size_t queueLength = 0;
    size_t inFlight = 0;
};

} // namespace flotilla
