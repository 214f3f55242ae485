#include "flotilla/dispatch/JobHistorySink.hpp"
#include "flotilla/logger/Logger.hpp"

namespace flotilla {

void LoggingJobHistorySink::record(const JobOutcome& outcome) {
    std::string line = "JobHistory: " + outcome.jobId + " " + jobStatusName(outcome.status) +
                       " attempts=" + std::to_string(outcome.attempts) +
                       " latency_ms=" + std::to_string(outcome.latency.count());
    if (!outcome.instanceId.empty()) {
        line += " instance=" + outcome.instanceId;
    }
    if (!outcome.ok()) {
        line += " error=" + std::string(errorCodeName(outcome.error)) + " reason=\"" + outcome.reason + "\"";
    }
    Logger::getInstance().logMessage(line);
}

} // namespace flotilla
