#pragma once
#include "ExampleRegistry.h"
#include "Config.h"
#include <functional>
#include <ostream>

namespace pattern_harness {

// Populates the registry before any example runs.
using RegistryBuilder = std::function<void(ExampleRegistry&, const Config&)>;

// Entry point behind main(). Exit codes:
//   0 everything attempted succeeded (or list/help/version)
//   1 at least one example failed or errored
//   2 usage error or unknown example name
//   3 registration error (duplicate or malformed example)
//   4 report could not be written
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err, const RegistryBuilder& build);

}
