#pragma once

#include <cstdint>

// Forward declaration to avoid including liburing.h in header
struct io_uring_cqe;
struct io_uring_sqe;

namespace flotilla {

class TimerRing;

/**
 * Base interface for operations submitted to a TimerRing.
 * The job's address travels through the ring as user_data.
 */
class RingJob {
public:
    virtual ~RingJob() = default;

    /**
     * Configure the SQE for this job's operation.
     */
    virtual void prepareSqe(struct io_uring_sqe* sqe) = 0;

    /**
     * Handle the completion on the ring thread. Called without the ring's
     * submission lock held.
     */
    virtual void handleCompletion(TimerRing& ring, struct io_uring_cqe* cqe) = 0;
};

} // namespace flotilla
