#pragma once
#include "Example.h"
#include <vector>
#include <unordered_map>

namespace pattern_harness {

struct Config;

// Catalogue of examples keyed by name, kept in registration order.
// Written during startup only; read-only once runs begin.
class ExampleRegistry {
public:
    // Throws DuplicateNameError (registry unchanged) or std::invalid_argument for an
    // empty name / missing factory.
    void register_example(ExampleSpec spec);

    // Registers the bundled GoF catalogue, binding seed and outage simulation from cfg.
    void register_all_default(const Config& cfg);

    // Throws NotFoundError.
    const ExampleSpec& lookup(const std::string& name) const;
    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    // Registration-ordered; iterate as often as needed.
    const std::vector<ExampleSpec>& all() const { return examples_; }
    std::size_t size() const { return examples_.size(); }
    bool empty() const { return examples_.empty(); }

private:
    std::vector<ExampleSpec> examples_;
    std::unordered_map<std::string, std::size_t> index_;
};

}
