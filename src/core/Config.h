#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace pattern_harness {

enum class Command { None, List, Run };

struct Config {
    Command command = Command::None;
    bool run_all = false; // run --all
    std::string run_name; // run --name NAME
    std::string format = "text"; // text | json | ndjson
    std::string output_file; // empty = stdout
    bool pretty = false;
    bool compact = false; // compact wins over pretty
    std::vector<std::string> enable_examples; // if non-empty, only these
    std::vector<std::string> disable_examples;
    std::string category; // empty = every category
    std::uint32_t seed = 42; // feeds every DeterministicSource
    int time_budget_ms = 1000; // soft per-example budget, 0 = unlimited
    std::vector<std::string> simulate_unavailable; // examples whose setup() reports a missing collaborator
    std::string log_level = "warn";
    bool verbose = false;
};

std::vector<std::string> split_csv(const std::string& s);

}
