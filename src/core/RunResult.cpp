#include "RunResult.h"
#include <stdexcept>

namespace pattern_harness {

const char* status_name(RunStatus s) {
    switch(s) {
        case RunStatus::Success: return "SUCCESS";
        case RunStatus::Failure: return "FAILED";
        case RunStatus::Error: return "ERRORED";
    }
    return "UNKNOWN";
}

const char* state_name(RunState s) {
    switch(s) {
        case RunState::Pending: return "pending";
        case RunState::Setup: return "setup";
        case RunState::Running: return "running";
        case RunState::Succeeded: return "succeeded";
        case RunState::Failed: return "failed";
        case RunState::Errored: return "errored";
    }
    return "unknown";
}

bool is_terminal(RunState s) {
    return s == RunState::Succeeded || s == RunState::Failed || s == RunState::Errored;
}

bool is_legal_transition(RunState from, RunState to) {
    switch(from) {
        case RunState::Pending: return to == RunState::Setup;
        case RunState::Setup: return to == RunState::Running || to == RunState::Errored;
        case RunState::Running: return to == RunState::Succeeded || to == RunState::Failed || to == RunState::Errored;
        default: return false; // terminal
    }
}

void RunTracker::advance(RunState next) {
    if(!is_legal_transition(state_, next)) {
        throw std::logic_error(std::string("illegal run transition ") + state_name(state_) + " -> " + state_name(next));
    }
    state_ = next;
    trace_.push_back(next);
}

}
