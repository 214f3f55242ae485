#pragma once

#include <atomic>

namespace flotilla {

/**
 * Lock-free state machine for a dispatched job.
 *
 * A job is touched by the submitting thread, a processing slot, the retry
 * timer thread and cancel()/shutdown() callers. Every transition is a CAS so
 * exactly one of them wins each race; the winner owns the follow-up work
 * (delivering the outcome, re-enqueueing, ...).
 *
 * State Transitions:
 * - QUEUED -> DISPATCHED: a slot popped the job (tryDispatch)
 * - DISPATCHED -> COMPLETED: execution succeeded (tryComplete)
 * - DISPATCHED -> BACKOFF: retryable failure, retry scheduled (tryBackoff)
 * - BACKOFF -> QUEUED: backoff elapsed, job re-appended (tryRequeue)
 * - DISPATCHED -> FAILED: terminal failure (tryFail)
 * - QUEUED/BACKOFF -> FAILED: rejected while waiting, e.g. shutdown (tryAbort)
 * - QUEUED/BACKOFF -> CANCELLED: caller cancelled before dispatch (tryCancel)
 *
 * COMPLETED, FAILED and CANCELLED are terminal.
 */
class JobStateMachine {
public:
    enum class State : int {
        QUEUED = 0,
        DISPATCHED = 1,
        BACKOFF = 2,
        COMPLETED = 3,
        FAILED = 4,
        CANCELLED = 5
    };

    JobStateMachine() : state_(State::QUEUED) {}

    bool tryDispatch() { return transition(State::QUEUED, State::DISPATCHED); }

    bool tryComplete() { return transition(State::DISPATCHED, State::COMPLETED); }

    bool tryBackoff() { return transition(State::DISPATCHED, State::BACKOFF); }

    bool tryRequeue() { return transition(State::BACKOFF, State::QUEUED); }

    bool tryFail() { return transition(State::DISPATCHED, State::FAILED); }

    /**
     * Fail a job that is not running.
     * @return true if the caller must deliver the failure
     */
    bool tryAbort() {
        return transition(State::QUEUED, State::FAILED) ||
               transition(State::BACKOFF, State::FAILED);
    }

    /**
     * Cancel a job that is not running.
     * @return true if cancelled, false if it is running or already terminal
     */
    bool tryCancel() {
        return transition(State::QUEUED, State::CANCELLED) ||
               transition(State::BACKOFF, State::CANCELLED);
    }

    bool isTerminal() const {
        State s = getState();
        return s == State::COMPLETED || s == State::FAILED || s == State::CANCELLED;
    }

    /**
     * Current state (may change immediately after reading)
     */
    State getState() const {
        return state_.load(std::memory_order_acquire);
    }

private:
    bool transition(State from, State to) {
        State expected = from;
        return state_.compare_exchange_strong(
            expected,
            to,
            std::memory_order_acq_rel,
            std::memory_order_acquire
        );
    }

    std::atomic<State> state_;
};

const char* jobStateName(JobStateMachine::State state);

} // namespace flotilla
