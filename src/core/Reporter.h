#pragma once
#include "RunResult.h"
#include <string>
#include <vector>
#include <cstddef>

namespace pattern_harness {

struct RunSummary {
    std::size_t total = 0;
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t errored = 0;
    bool all_succeeded() const { return success == total; }
};

RunSummary summarize(const std::vector<RunResult>& results);

// Line-oriented report for humans and shell scripts:
//   <STATUS>\t<name>\t<detail>   one per attempted example
//   TOTAL=<n> SUCCESS=<n> FAILED=<n> ERRORED=<n>
class TextReporter {
public:
    explicit TextReporter(bool verbose = false) : verbose_(verbose) {}
    std::string render(const std::vector<RunResult>& results) const;

    static std::string detail(const RunResult& r);
    static std::string summary_line(const RunSummary& s);

private:
    bool verbose_;
};

}
