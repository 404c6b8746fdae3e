#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class PaymentStrategy {
public:
    virtual ~PaymentStrategy() = default;
    virtual std::string pay(int amount) const = 0;
};

// Context; the algorithm is swapped at runtime.
class ShoppingCart {
public:
    void set_payment(const PaymentStrategy* strategy) { strategy_ = strategy; }
    std::string checkout(int amount) const;

private:
    const PaymentStrategy* strategy_ = nullptr; // not owned
};

class StrategyExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Strategy", "Define a family of algorithms and make them interchangeable at runtime"};
    }

private:
    std::vector<std::unique_ptr<PaymentStrategy>> strategies_;
};

}
}
