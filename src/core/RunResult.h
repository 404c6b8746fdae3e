#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace pattern_harness {

enum class RunStatus { Success, Failure, Error };

// Per-run lifecycle: Pending -> Setup -> Running -> {Succeeded | Failed | Errored}.
enum class RunState { Pending, Setup, Running, Succeeded, Failed, Errored };

const char* status_name(RunStatus s); // SUCCESS | FAILED | ERRORED
const char* state_name(RunState s);
bool is_terminal(RunState s);
bool is_legal_transition(RunState from, RunState to);

struct RunResult {
    std::string name;
    RunStatus status = RunStatus::Success;
    std::vector<std::string> output;
    std::optional<std::string> failure_reason; // present iff status != Success
    RunState state = RunState::Pending;
    std::vector<RunState> transitions; // every state visited, starting with Pending
    std::chrono::milliseconds duration{0};
};

// Guards the lifecycle of a single run and records its trace.
// advance() throws std::logic_error on an out-of-order transition.
class RunTracker {
public:
    RunTracker() { trace_.push_back(RunState::Pending); }

    void advance(RunState next);
    RunState state() const { return state_; }
    const std::vector<RunState>& trace() const { return trace_; }

private:
    RunState state_ = RunState::Pending;
    std::vector<RunState> trace_;
};

}
