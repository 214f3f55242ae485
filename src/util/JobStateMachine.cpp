#include "flotilla/util/JobStateMachine.hpp"

namespace flotilla {

const char* jobStateName(JobStateMachine::State state) {
    switch (state) {
    case JobStateMachine::State::QUEUED: return "queued";
    case JobStateMachine::State::DISPATCHED: return "dispatched";
    case JobStateMachine::State::BACKOFF: return "backoff";
    case JobStateMachine::State::COMPLETED: return "completed";
    case JobStateMachine::State::FAILED: return "failed";
    case JobStateMachine::State::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace flotilla
