#include "flotilla/Errors.hpp"

namespace flotilla {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::NONE: return "none";
    case ErrorCode::CAPACITY: return "capacity";
    case ErrorCode::PROVISIONING: return "provisioning";
    case ErrorCode::NO_INSTANCE_AVAILABLE: return "no_instance_available";
    case ErrorCode::RATE_LIMIT_EXCEEDED: return "rate_limit_exceeded";
    case ErrorCode::EXECUTION_TIMEOUT: return "execution_timeout";
    case ErrorCode::EXECUTION_ERROR: return "execution_error";
    case ErrorCode::SHUTTING_DOWN: return "shutting_down";
    case ErrorCode::NOT_FOUND: return "not_found";
    case ErrorCode::INVALID_JOB: return "invalid_job";
    case ErrorCode::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool PoolError::retryable() const noexcept {
    switch (code_) {
    case ErrorCode::CAPACITY:
    case ErrorCode::PROVISIONING:
    case ErrorCode::NO_INSTANCE_AVAILABLE:
    case ErrorCode::EXECUTION_TIMEOUT:
    case ErrorCode::EXECUTION_ERROR:
        return true;
    default:
        return false;
    }
}

} // namespace flotilla
