#include "OutageSimulation.h"
#include "../core/Errors.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

void OutageSimulation::setup() {
    throw SetupError("collaborator unavailable for " + inner_->describe().name + " (simulated)");
}

std::vector<std::string> OutageSimulation::run() {
    throw std::logic_error("run() called after failed setup()");
}

ExampleFactory with_outage(ExampleFactory factory) {
    return [factory = std::move(factory)]() -> ExamplePtr {
        ExamplePtr inner = factory();
        if(!inner) return nullptr;
        return std::make_unique<OutageSimulation>(std::move(inner));
    };
}

}
}
