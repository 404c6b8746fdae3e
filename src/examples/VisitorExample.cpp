#include "VisitorExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    struct AreaVisitor {
        std::string operator()(const Square& s) const { return "square area " + std::to_string(s.side * s.side); }
        std::string operator()(const Rectangle& r) const { return "rectangle area " + std::to_string(r.width * r.height); }
        std::string operator()(const Triangle& t) const { return "triangle area " + std::to_string(t.base * t.height / 2); }
    };

    struct ExportVisitor {
        std::string operator()(const Square& s) const { return "export square side=" + std::to_string(s.side); }
        std::string operator()(const Rectangle& r) const { return "export rectangle " + std::to_string(r.width) + "x" + std::to_string(r.height); }
        std::string operator()(const Triangle& t) const {
            return "export triangle base=" + std::to_string(t.base) + " height=" + std::to_string(t.height);
        }
    };
}

std::string visit(ShapeOperation op, const Shape& shape) {
    switch(op) {
        case ShapeOperation::Area: return std::visit(AreaVisitor{}, shape);
        case ShapeOperation::Export: return std::visit(ExportVisitor{}, shape);
    }
    return {};
}

void VisitorExample::setup() {
    shapes_ = {Square{3}, Rectangle{2, 5}, Triangle{4, 3}};
}

std::vector<std::string> VisitorExample::run() {
    std::vector<std::string> out;
    for(auto op : {ShapeOperation::Area, ShapeOperation::Export}) {
        for(const auto& s : shapes_) out.push_back(examples::visit(op, s));
    }
    return out;
}

}
}
