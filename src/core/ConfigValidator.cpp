#include "ConfigValidator.h"
#include "Example.h"
#include "Logging.h"
#include <algorithm>

namespace pattern_harness {

bool ConfigValidator::validate(Config& cfg) {
    error_.clear();
    if(cfg.command == Command::None) return fail("missing command (list or run)");

    if(cfg.command == Command::Run) {
        if(cfg.run_all && !cfg.run_name.empty()) return fail("--all and --name are mutually exclusive");
        if(!cfg.run_all && cfg.run_name.empty()) return fail("run requires --all or --name NAME");
        if(!cfg.run_name.empty() && (!cfg.enable_examples.empty() || !cfg.disable_examples.empty() || !cfg.category.empty())) {
            return fail("--name cannot be combined with --enable, --disable or --category");
        }
    } else if(cfg.run_all || !cfg.run_name.empty()) {
        return fail("--all and --name only apply to run");
    }

    if(cfg.format != "text" && cfg.format != "json" && cfg.format != "ndjson") {
        return fail("Invalid --format value: " + cfg.format);
    }
    // compact wins (documented behavior)
    if(cfg.pretty && cfg.compact) cfg.pretty = false;

    if(!cfg.category.empty() && !parse_category(cfg.category)) {
        return fail("Invalid --category value: " + cfg.category);
    }
    if(cfg.time_budget_ms < 0) return fail("--time-budget-ms must not be negative");

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) return fail("Invalid --log-level value: " + cfg.log_level);

    if(!validate_names(cfg.enable_examples, "--enable")) return false;
    if(!validate_names(cfg.disable_examples, "--disable")) return false;
    if(!validate_names(cfg.simulate_unavailable, "--simulate-unavailable")) return false;
    for(const auto& name : cfg.enable_examples) {
        if(std::find(cfg.disable_examples.begin(), cfg.disable_examples.end(), name) != cfg.disable_examples.end()) {
            return fail("Cannot enable and disable the same example: " + name);
        }
    }
    return true;
}

bool ConfigValidator::validate_names(const std::vector<std::string>& names, const std::string& flag) {
    for(const auto& name : names) {
        if(name.size() > 256) return fail(flag + ": example name too long");
        for(char c : name) {
            if(c < 32 || c > 126) return fail(flag + ": example name contains invalid character");
        }
    }
    return true;
}

}
