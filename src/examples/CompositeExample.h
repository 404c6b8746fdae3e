#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// Leaf (employee) or composite (unit); a node with children is a unit.
class OrgNode {
public:
    OrgNode(std::string name, int salary = 0) : name_(std::move(name)), salary_(salary) {}

    OrgNode& add(std::unique_ptr<OrgNode> child);
    int total_salary() const;
    // Pre-order, two spaces of indentation per level.
    void report(std::vector<std::string>& out, int depth = 0) const;

private:
    std::string name_;
    int salary_;
    std::vector<std::unique_ptr<OrgNode>> children_;
};

class CompositeExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Composite", "Treat individual objects and compositions of objects uniformly"};
    }

private:
    std::unique_ptr<OrgNode> root_;
};

}
}
