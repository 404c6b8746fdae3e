#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// One payment account in the chain; forwards what it cannot cover to its successor.
class Account {
public:
    Account(std::string name, int balance) : name_(std::move(name)), balance_(balance) {}

    void set_next(Account* next) { next_ = next; }
    void pay(int amount, std::vector<std::string>& out);

private:
    std::string name_;
    int balance_;
    Account* next_ = nullptr; // not owned
};

class ChainOfResponsibilityExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"ChainOfResponsibility", "Pass a request along a chain of handlers until one handles it"};
    }

private:
    struct Funding {
        std::string name;
        int balance;
    };
    // Starting balances in chain order; every run() spends from fresh accounts.
    std::vector<Funding> funding_;
};

}
}
