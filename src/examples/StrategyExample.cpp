#include "StrategyExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

namespace {
    class CreditCardPayment : public PaymentStrategy {
    public:
        std::string pay(int amount) const override { return "paid " + std::to_string(amount) + " with credit card"; }
    };

    class PayPalPayment : public PaymentStrategy {
    public:
        std::string pay(int amount) const override { return "paid " + std::to_string(amount) + " using PayPal"; }
    };
}

std::string ShoppingCart::checkout(int amount) const {
    if(!strategy_) throw std::logic_error("no payment strategy selected");
    return strategy_->pay(amount);
}

void StrategyExample::setup() {
    if(!strategies_.empty()) return;
    strategies_.push_back(std::make_unique<CreditCardPayment>());
    strategies_.push_back(std::make_unique<PayPalPayment>());
}

std::vector<std::string> StrategyExample::run() {
    ShoppingCart cart;
    std::vector<std::string> out;
    for(const auto& s : strategies_) {
        cart.set_payment(s.get());
        out.push_back(cart.checkout(15));
    }
    return out;
}

}
}
