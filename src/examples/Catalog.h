#pragma once
#include "../core/Example.h"
#include <vector>

namespace pattern_harness {

struct Config;

namespace examples {

// The bundled Gang-of-Four catalogue in book order (creational, structural, behavioral).
// Factories capture cfg.seed; names listed in cfg.simulate_unavailable get an outage wrapper.
std::vector<ExampleSpec> default_catalog(const Config& cfg);

}
}
