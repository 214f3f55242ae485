#pragma once

#include "flotilla/dispatch/Job.hpp"

namespace flotilla {

/**
 * Receives every terminal job outcome, e.g. to persist chat history.
 * Called on the thread that finished the job; exceptions are logged.
 */
class JobHistorySink {
public:
    virtual ~JobHistorySink() = default;
    virtual void record(const JobOutcome& outcome) = 0;
};

/**
 * Writes one line per outcome through the global Logger.
 */
class LoggingJobHistorySink : public JobHistorySink {
public:
    void record(const JobOutcome& outcome) override;
};

} // namespace flotilla
