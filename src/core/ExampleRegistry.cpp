#include "ExampleRegistry.h"
#include "Errors.h"
#include "Logging.h"
#include "Config.h"
#include "../examples/Catalog.h"
#include <stdexcept>

namespace pattern_harness {

void ExampleRegistry::register_example(ExampleSpec spec) {
    if(spec.name.empty()) throw std::invalid_argument("example name must not be empty");
    if(!spec.factory) throw std::invalid_argument("example " + spec.name + " has no factory");
    if(index_.count(spec.name)) throw DuplicateNameError(spec.name);
    Logger::instance().trace("Registered example: " + spec.name);
    std::string name = spec.name;
    examples_.push_back(std::move(spec));
    index_.emplace(std::move(name), examples_.size() - 1);
}

void ExampleRegistry::register_all_default(const Config& cfg) {
    for(auto& spec : examples::default_catalog(cfg)) {
        register_example(std::move(spec));
    }
}

const ExampleSpec& ExampleRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if(it == index_.end()) throw NotFoundError(name);
    return examples_[it->second];
}

}
