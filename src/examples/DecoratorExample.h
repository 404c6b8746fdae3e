#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Coffee {
public:
    virtual ~Coffee() = default;
    virtual int cost() const = 0;
    virtual std::string description() const = 0;
};

// Adds an ingredient on top of any Coffee it owns.
class CoffeeAddition : public Coffee {
public:
    CoffeeAddition(std::unique_ptr<Coffee> inner, std::string ingredient, int price)
        : inner_(std::move(inner)), ingredient_(std::move(ingredient)), price_(price) {}
    int cost() const override { return inner_->cost() + price_; }
    std::string description() const override { return inner_->description() + ", " + ingredient_; }

private:
    std::unique_ptr<Coffee> inner_;
    std::string ingredient_;
    int price_;
};

class DecoratorExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Decorator", "Attach additional responsibilities to an object dynamically"};
    }
};

}
}
