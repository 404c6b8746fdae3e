#include "ChainOfResponsibilityExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

void Account::pay(int amount, std::vector<std::string>& out) {
    if(balance_ >= amount) {
        balance_ -= amount;
        out.push_back("paid " + std::to_string(amount) + " using " + name_);
        return;
    }
    if(!next_) {
        out.push_back("no account can pay " + std::to_string(amount));
        return;
    }
    out.push_back(name_ + " cannot pay " + std::to_string(amount) + ", forwarding");
    next_->pay(amount, out);
}

void ChainOfResponsibilityExample::setup() {
    funding_ = {{"bank", 100}, {"paypal", 200}, {"bitcoin", 300}};
}

std::vector<std::string> ChainOfResponsibilityExample::run() {
    if(funding_.empty()) throw std::logic_error("setup() not called");
    std::vector<std::unique_ptr<Account>> accounts;
    for(const auto& f : funding_) accounts.push_back(std::make_unique<Account>(f.name, f.balance));
    for(std::size_t i = 0; i + 1 < accounts.size(); ++i) accounts[i]->set_next(accounts[i + 1].get());

    std::vector<std::string> out;
    accounts.front()->pay(259, out);
    accounts.front()->pay(50, out);
    accounts.front()->pay(1000, out);
    return out;
}

}
}
