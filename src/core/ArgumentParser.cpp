#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <functional>
#include <vector>
#include <stdexcept>

namespace pattern_harness {

void ArgumentParser::print_help() const {
    out_ << "usage: pattern-harness list [--verbose]\n"
            "       pattern-harness run --all [flags]\n"
            "       pattern-harness run --name NAME [flags]\n\n"
            "options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--all", "Run every registered example"},
        {"--name NAME", "Run a single example"},
        {"--format text|json|ndjson", "Report format (default text)"},
        {"--output FILE", "Write the report to FILE (default stdout)"},
        {"--pretty", "Indent JSON output"},
        {"--compact", "Minified JSON output (wins over --pretty)"},
        {"--enable name[,name...]", "Only run the listed examples"},
        {"--disable name[,name...]", "Skip the listed examples"},
        {"--category CAT", "creational, structural or behavioral"},
        {"--seed N", "Seed for deterministic example randomness"},
        {"--time-budget-ms N", "Soft per-example budget, 0 disables"},
        {"--simulate-unavailable list", "Examples whose collaborators are unavailable"},
        {"--log-level LEVEL", "error, warn, info, debug or trace"},
        {"--verbose", "Show output of failed examples / intents in list"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines) {
        out_ << "  " << l.name;
        if(l.name.size() < 30) for(size_t i = l.name.size(); i < 30; ++i) out_ << ' ';
        else out_ << ' ';
        out_ << l.help << "\n";
    }
}

void ArgumentParser::print_version() const {
    out_ << "pattern-harness " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
         << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
         << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    error_.clear();
    exit_code_ = 0;
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    auto need_int = [&](const std::string& v, const char* flag, long long lo, long long hi, long long& out) {
        try {
            size_t used = 0;
            out = std::stoll(v, &used);
            if(used != v.size() || out < lo || out > hi) return fail(std::string("Invalid integer for ") + flag + ": " + v);
        } catch(const std::exception&) {
            return fail(std::string("Invalid integer for ") + flag + ": " + v);
        }
        return true;
    };
    std::vector<FlagSpec> specs = {
        {"--all", ArgKind::None, [&](const std::string&){ cfg.run_all = true; return true; }},
        {"--name", ArgKind::String, [&](const std::string& v){ cfg.run_name = v; return true; }},
        {"--format", ArgKind::String, [&](const std::string& v){ cfg.format = v; return true; }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; return true; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ cfg.pretty = true; return true; }},
        {"--compact", ArgKind::None, [&](const std::string&){ cfg.compact = true; return true; }},
        {"--enable", ArgKind::CSV, [&](const std::string& v){ cfg.enable_examples = split_csv(v); return true; }},
        {"--disable", ArgKind::CSV, [&](const std::string& v){ cfg.disable_examples = split_csv(v); return true; }},
        {"--category", ArgKind::String, [&](const std::string& v){ cfg.category = v; return true; }},
        {"--seed", ArgKind::Int, [&](const std::string& v){
            long long n = 0;
            if(!need_int(v, "--seed", 0, 0xFFFFFFFFLL, n)) return false;
            cfg.seed = static_cast<std::uint32_t>(n);
            return true; }},
        {"--time-budget-ms", ArgKind::Int, [&](const std::string& v){
            long long n = 0;
            if(!need_int(v, "--time-budget-ms", 0, 3600000, n)) return false;
            cfg.time_budget_ms = static_cast<int>(n);
            return true; }},
        {"--simulate-unavailable", ArgKind::CSV, [&](const std::string& v){ cfg.simulate_unavailable = split_csv(v); return true; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; return true; }},
        {"--verbose", ArgKind::None, [&](const std::string&){ cfg.verbose = true; return true; }}
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s : specs) if(flag == s.name) return &s; return nullptr; };

    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if(a == "--help" || a == "-h") { print_help(); return false; }
        if(a == "--version") { print_version(); return false; }
        if(!a.empty() && a[0] != '-') {
            if(cfg.command != Command::None) return fail("Unexpected argument: " + a);
            if(a == "list") cfg.command = Command::List;
            else if(a == "run") cfg.command = Command::Run;
            else return fail("Unknown command: " + a);
            continue;
        }
        auto* spec = find_spec(a);
        if(!spec) return fail("Unknown arg: " + a);
        std::string val;
        if(spec->kind != ArgKind::None) {
            if(i + 1 >= argc || !argv[i + 1]) return fail("Missing value for " + a);
            val = argv[++i];
        }
        if(!spec->apply(val)) return false;
    }
    return true;
}

}
