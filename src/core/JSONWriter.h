#pragma once
#include "RunResult.h"
#include "Config.h"
#include <string>
#include <vector>

namespace pattern_harness {

// Machine-readable report. Object keys are emitted in sorted order so that two runs
// with the same results produce byte-identical documents (apart from generated_at).
class JSONWriter {
public:
    // {meta, summary, results[]}; honours cfg.pretty / cfg.compact.
    std::string write(const std::vector<RunResult>& results, const Config& cfg) const;
    // One meta line, one summary line, then one line per result.
    std::string write_ndjson(const std::vector<RunResult>& results, const Config& cfg) const;
};

}
