#include "PrototypeExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

void PrototypeExample::setup() {
    original_ = std::make_unique<Sheep>("Jolly", "Mountain Sheep");
}

std::vector<std::string> PrototypeExample::run() {
    if(!original_) throw std::logic_error("setup() not called");
    auto cloned = original_->clone();
    cloned->set_name("Dolly");
    return {
        "original: " + original_->name() + " (" + original_->category() + ")",
        "clone: " + cloned->name() + " (" + cloned->category() + ")",
        std::string("distinct objects: ") + (cloned.get() != original_.get() ? "true" : "false")
    };
}

}
}
