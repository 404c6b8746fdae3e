#include "CompositeExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

OrgNode& OrgNode::add(std::unique_ptr<OrgNode> child) {
    children_.push_back(std::move(child));
    return *children_.back();
}

int OrgNode::total_salary() const {
    int total = salary_;
    for(const auto& c : children_) total += c->total_salary();
    return total;
}

void OrgNode::report(std::vector<std::string>& out, int depth) const {
    out.push_back(std::string(static_cast<std::size_t>(depth * 2), ' ') + name_ + " " + std::to_string(total_salary()));
    for(const auto& c : children_) c->report(out, depth + 1);
}

void CompositeExample::setup() {
    root_ = std::make_unique<OrgNode>("company");
    auto& eng = root_->add(std::make_unique<OrgNode>("engineering"));
    eng.add(std::make_unique<OrgNode>("alice", 12000));
    eng.add(std::make_unique<OrgNode>("bob", 10000));
    auto& design = root_->add(std::make_unique<OrgNode>("design"));
    design.add(std::make_unique<OrgNode>("carol", 9000));
}

std::vector<std::string> CompositeExample::run() {
    if(!root_) throw std::logic_error("setup() not called");
    std::vector<std::string> out;
    root_->report(out);
    return out;
}

}
}
