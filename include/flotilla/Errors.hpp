#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace flotilla {

enum class ErrorCode : int {
    NONE = 0,
    CAPACITY,               // pool or queue at its bound
    PROVISIONING,           // backend factory failed to materialize a worker
    NO_INSTANCE_AVAILABLE,  // acquire deadline elapsed
    RATE_LIMIT_EXCEEDED,    // caller over quota
    EXECUTION_TIMEOUT,      // backend missed the execution deadline
    EXECUTION_ERROR,        // backend reported a failure
    SHUTTING_DOWN,          // orchestrator is tearing down
    NOT_FOUND,              // unknown instance or job id
    INVALID_JOB,            // job rejected before dispatch
    CANCELLED               // job cancelled by its caller
};

const char* errorCodeName(ErrorCode code);

/**
 * Base of every error the orchestrator raises. Callers that only need the
 * taxonomy can catch PoolError and switch on code().
 */
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    /**
     * Whether the dispatcher may retry a job that failed with this error.
     */
    virtual bool retryable() const noexcept;

private:
    ErrorCode code_;
};

class CapacityError : public PoolError {
public:
    explicit CapacityError(const std::string& what) : PoolError(ErrorCode::CAPACITY, what) {}
};

class ProvisioningError : public PoolError {
public:
    explicit ProvisioningError(const std::string& what) : PoolError(ErrorCode::PROVISIONING, what) {}
};

class NoInstanceAvailable : public PoolError {
public:
    explicit NoInstanceAvailable(const std::string& what)
        : PoolError(ErrorCode::NO_INSTANCE_AVAILABLE, what) {}
};

class RateLimitExceeded : public PoolError {
public:
    RateLimitExceeded(const std::string& what, std::chrono::milliseconds retry_after)
        : PoolError(ErrorCode::RATE_LIMIT_EXCEEDED, what), retry_after_(retry_after) {}

    // Time until the oldest request leaves the caller's window
    std::chrono::milliseconds retryAfter() const noexcept { return retry_after_; }

private:
    std::chrono::milliseconds retry_after_;
};

class ExecutionTimeout : public PoolError {
public:
    explicit ExecutionTimeout(const std::string& what) : PoolError(ErrorCode::EXECUTION_TIMEOUT, what) {}
};

/**
 * Thrown by WorkerBackend::execute on downstream failure.
 * @param terminal     the job must not be retried
 * @param instance_fault the worker itself is broken and must be recycled
 */
class ExecutionError : public PoolError {
public:
    explicit ExecutionError(const std::string& what, bool terminal = false, bool instance_fault = false)
        : PoolError(ErrorCode::EXECUTION_ERROR, what), terminal_(terminal),
          instance_fault_(instance_fault) {}

    bool retryable() const noexcept override { return !terminal_; }
    bool terminal() const noexcept { return terminal_; }
    bool instanceFault() const noexcept { return instance_fault_; }

private:
    bool terminal_;
    bool instance_fault_;
};

class ShuttingDown : public PoolError {
public:
    explicit ShuttingDown(const std::string& what) : PoolError(ErrorCode::SHUTTING_DOWN, what) {}
};

class NotFound : public PoolError {
public:
    explicit NotFound(const std::string& what) : PoolError(ErrorCode::NOT_FOUND, what) {}
};

class InvalidJob : public PoolError {
public:
    explicit InvalidJob(const std::string& what) : PoolError(ErrorCode::INVALID_JOB, what) {}
};

} // namespace flotilla
