#pragma once
#include "ExampleRegistry.h"
#include "RunResult.h"
#include "Config.h"
#include <vector>
#include <string>

namespace pattern_harness {

// Drives examples through setup() and run() and folds every per-example failure
// into a RunResult. Only registry-level errors (unknown name) escape.
class Runner {
public:
    Runner(const ExampleRegistry& registry, const Config& cfg) : registry_(registry), cfg_(cfg) {}

    // Throws NotFoundError before anything executes if name is not registered.
    RunResult run_one(const std::string& name) const;

    // Every selected example in registration order; one result per attempted example.
    std::vector<RunResult> run_all() const;

    // Applies --enable/--disable/--category.
    bool is_selected(const ExampleSpec& spec) const;

    // Throws FailureMismatch naming the first differing line.
    static void verify_outcome(const std::vector<std::string>& expected, const std::vector<std::string>& actual);

private:
    RunResult execute(const ExampleSpec& spec) const;

    const ExampleRegistry& registry_;
    const Config& cfg_;
};

}
