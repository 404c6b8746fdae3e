#pragma once
#include "../core/Example.h"
#include <variant>

namespace pattern_harness {
namespace examples {

struct Square { int side; };
struct Rectangle { int width; int height; };
struct Triangle { int base; int height; };

// Closed set of element types; operations dispatch on the active alternative.
using Shape = std::variant<Square, Rectangle, Triangle>;

enum class ShapeOperation { Area, Export };

// Single dispatch point for every operation over every shape.
std::string visit(ShapeOperation op, const Shape& shape);

class VisitorExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Visitor", "Add operations over a fixed set of element types without changing them"};
    }

private:
    std::vector<Shape> shapes_;
};

}
}
