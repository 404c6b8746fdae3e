#include "core/Cli.h"
#include <iostream>
#include <exception>

int main(int argc, char** argv) {
    try {
        return pattern_harness::run_cli(argc, argv, std::cout, std::cerr);
    } catch(const std::exception& ex) {
        std::cerr << "fatal: " << ex.what() << "\n";
        return 1;
    }
}
