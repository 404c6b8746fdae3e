#include "Runner.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>
#include <chrono>

namespace pattern_harness {

namespace {
    std::string display(const std::vector<std::string>& lines, std::size_t i) {
        if(i >= lines.size()) return "<missing>";
        return "\"" + lines[i] + "\"";
    }

    void finish(RunResult& r, RunTracker& tracker, RunState terminal, RunStatus status, std::optional<std::string> reason) {
        tracker.advance(terminal);
        r.state = tracker.state();
        r.transitions = tracker.trace();
        r.status = status;
        r.failure_reason = std::move(reason);
    }
}

void Runner::verify_outcome(const std::vector<std::string>& expected, const std::vector<std::string>& actual) {
    std::size_t n = std::max(expected.size(), actual.size());
    for(std::size_t i = 0; i < n; ++i) {
        if(i < expected.size() && i < actual.size() && expected[i] == actual[i]) continue;
        throw FailureMismatch(i + 1, display(expected, i), display(actual, i));
    }
}

bool Runner::is_selected(const ExampleSpec& spec) const {
    if(!cfg_.enable_examples.empty()) {
        if(std::find(cfg_.enable_examples.begin(), cfg_.enable_examples.end(), spec.name) == cfg_.enable_examples.end()) return false;
    }
    if(!cfg_.disable_examples.empty()) {
        if(std::find(cfg_.disable_examples.begin(), cfg_.disable_examples.end(), spec.name) != cfg_.disable_examples.end()) return false;
    }
    if(!cfg_.category.empty()) {
        auto cat = parse_category(cfg_.category);
        if(!cat || *cat != spec.category) return false;
    }
    return true;
}

RunResult Runner::run_one(const std::string& name) const {
    return execute(registry_.lookup(name));
}

std::vector<RunResult> Runner::run_all() const {
    std::vector<RunResult> results;
    results.reserve(registry_.size());
    for(const auto& spec : registry_.all()) {
        if(!is_selected(spec)) {
            Logger::instance().trace("Skipping example: " + spec.name);
            continue;
        }
        results.push_back(execute(spec));
    }
    return results;
}

RunResult Runner::execute(const ExampleSpec& spec) const {
    using clock = std::chrono::steady_clock;
    RunResult r;
    r.name = spec.name;
    RunTracker tracker;
    auto start = clock::now();
    auto elapsed = [&]{ return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start); };

    Logger::instance().debug("Starting example: " + spec.name);
    tracker.advance(RunState::Setup);
    ExamplePtr example;
    try {
        example = spec.factory();
        if(!example) throw SetupError("factory produced no instance");
        example->setup();
    } catch(const std::exception& ex) {
        r.duration = elapsed();
        finish(r, tracker, RunState::Errored, RunStatus::Error, std::string("setup: ") + ex.what());
        Logger::instance().warn(spec.name + " errored during setup: " + ex.what());
        return r;
    } catch(...) {
        r.duration = elapsed();
        finish(r, tracker, RunState::Errored, RunStatus::Error, std::string("setup: unknown exception"));
        Logger::instance().warn(spec.name + " errored during setup: unknown exception");
        return r;
    }

    tracker.advance(RunState::Running);
    try {
        r.output = example->run();
    } catch(const std::exception& ex) {
        r.duration = elapsed();
        finish(r, tracker, RunState::Errored, RunStatus::Error, std::string("run: ") + ex.what());
        Logger::instance().warn(spec.name + " errored while running: " + ex.what());
        return r;
    } catch(...) {
        r.duration = elapsed();
        finish(r, tracker, RunState::Errored, RunStatus::Error, std::string("run: unknown exception"));
        Logger::instance().warn(spec.name + " errored while running: unknown exception");
        return r;
    }
    r.duration = elapsed();

    if(cfg_.time_budget_ms > 0 && r.duration.count() > cfg_.time_budget_ms) {
        finish(r, tracker, RunState::Errored, RunStatus::Error,
               "time budget exceeded: " + std::to_string(r.duration.count()) + "ms > " + std::to_string(cfg_.time_budget_ms) + "ms");
        Logger::instance().warn(spec.name + " exceeded its time budget");
        return r;
    }

    if(spec.expected_outcome) {
        try {
            verify_outcome(*spec.expected_outcome, r.output);
        } catch(const FailureMismatch& mm) {
            finish(r, tracker, RunState::Failed, RunStatus::Failure, std::string(mm.what()));
            Logger::instance().warn(spec.name + " failed: " + mm.what());
            return r;
        }
    }

    finish(r, tracker, RunState::Succeeded, RunStatus::Success, std::nullopt);
    Logger::instance().debug("Finished example: " + spec.name + " (" + std::to_string(r.output.size()) + " lines)");
    return r;
}

}
