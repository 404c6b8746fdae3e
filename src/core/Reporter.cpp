#include "Reporter.h"
#include <sstream>

namespace pattern_harness {

namespace {
    // Keeps the report one record per line.
    std::string single_line(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for(char c : s) out.push_back((c == '\n' || c == '\r' || c == '\t') ? ' ' : c);
        return out;
    }
}

RunSummary summarize(const std::vector<RunResult>& results) {
    RunSummary s;
    s.total = results.size();
    for(const auto& r : results) {
        switch(r.status) {
            case RunStatus::Success: ++s.success; break;
            case RunStatus::Failure: ++s.failed; break;
            case RunStatus::Error: ++s.errored; break;
        }
    }
    return s;
}

std::string TextReporter::detail(const RunResult& r) {
    if(r.status == RunStatus::Success) {
        return "ok (" + std::to_string(r.output.size()) + (r.output.size() == 1 ? " line)" : " lines)");
    }
    return single_line(r.failure_reason.value_or("unspecified failure"));
}

std::string TextReporter::summary_line(const RunSummary& s) {
    std::ostringstream os;
    os << "TOTAL=" << s.total << " SUCCESS=" << s.success << " FAILED=" << s.failed << " ERRORED=" << s.errored;
    return os.str();
}

std::string TextReporter::render(const std::vector<RunResult>& results) const {
    std::ostringstream os;
    for(const auto& r : results) {
        os << status_name(r.status) << '\t' << r.name << '\t' << detail(r) << '\n';
        if(verbose_ && r.status != RunStatus::Success) {
            for(const auto& line : r.output) os << "  | " << single_line(line) << '\n';
        }
    }
    os << summary_line(summarize(results)) << '\n';
    return os.str();
}

}
