#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// Wraps an example whose collaborator is reported unavailable: setup() always throws
// SetupError, describe() still answers so listings keep working.
class OutageSimulation : public Example {
public:
    explicit OutageSimulation(ExamplePtr inner) : inner_(std::move(inner)) {}

    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override { return inner_->describe(); }

private:
    ExamplePtr inner_;
};

// Factory decorator applying OutageSimulation to every instance the factory makes.
ExampleFactory with_outage(ExampleFactory factory);

}
}
