#pragma once
#include "Config.h"
#include <string>

namespace pattern_harness {

// Post-parse normalization and consistency checks.
class ConfigValidator {
public:
    // Returns false with error() set when the combination is unusable.
    bool validate(Config& cfg);
    const std::string& error() const { return error_; }

private:
    bool fail(const std::string& msg) { error_ = msg; return false; }
    bool validate_names(const std::vector<std::string>& names, const std::string& flag);

    std::string error_;
};

}
