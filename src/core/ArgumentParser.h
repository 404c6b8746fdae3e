#pragma once
#include "Config.h"
#include <iostream>
#include <string>

namespace pattern_harness {

// Parses `pattern-harness <list|run> [flags]` into Config.
// parse() returns false when the process should stop: --help/--version (exit_code 0)
// or a usage error (exit_code 2, message in error()).
class ArgumentParser {
public:
    explicit ArgumentParser(std::ostream& out = std::cout) : out_(out) {}

    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    bool fail(const std::string& msg) { error_ = msg; exit_code_ = 2; return false; }

    std::ostream& out_;
    std::string error_;
    int exit_code_ = 0;
};

}
