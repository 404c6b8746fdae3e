#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // argv[0] is skipped by the parser
    std::vector<std::string> args{"pattern-harness"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream sink;
    pattern_harness::ArgumentParser parser(sink);
    pattern_harness::Config cfg;
    if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
        pattern_harness::ConfigValidator validator;
        validator.validate(cfg);
    }
    return 0;
}
