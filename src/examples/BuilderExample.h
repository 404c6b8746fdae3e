#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

struct Burger {
    int size = 0;
    std::vector<std::string> toppings;
    std::string to_string() const;
};

// Step-wise construction of a Burger; build() may be called once per builder.
class BurgerBuilder {
public:
    explicit BurgerBuilder(int size) { burger_.size = size; }
    BurgerBuilder& add_cheese() { burger_.toppings.push_back("cheese"); return *this; }
    BurgerBuilder& add_pepperoni() { burger_.toppings.push_back("pepperoni"); return *this; }
    BurgerBuilder& add_lettuce() { burger_.toppings.push_back("lettuce"); return *this; }
    BurgerBuilder& add_tomato() { burger_.toppings.push_back("tomato"); return *this; }
    Burger build() { return std::move(burger_); }

private:
    Burger burger_;
};

class BuilderExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Builder", "Separate the construction of a complex object from its representation"};
    }
};

}
}
