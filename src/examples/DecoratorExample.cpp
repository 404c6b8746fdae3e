#include "DecoratorExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class SimpleCoffee : public Coffee {
    public:
        int cost() const override { return 10; }
        std::string description() const override { return "Simple coffee"; }
    };

    std::string line(const Coffee& c) { return c.description() + ": " + std::to_string(c.cost()); }
}

std::vector<std::string> DecoratorExample::run() {
    std::vector<std::string> out;
    std::unique_ptr<Coffee> coffee = std::make_unique<SimpleCoffee>();
    out.push_back(line(*coffee));
    coffee = std::make_unique<CoffeeAddition>(std::move(coffee), "milk", 2);
    out.push_back(line(*coffee));
    coffee = std::make_unique<CoffeeAddition>(std::move(coffee), "whip", 5);
    out.push_back(line(*coffee));
    coffee = std::make_unique<CoffeeAddition>(std::move(coffee), "vanilla", 3);
    out.push_back(line(*coffee));
    return out;
}

}
}
