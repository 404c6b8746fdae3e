#include "InterpreterExample.h"
#include "../core/Errors.h"
#include <sstream>
#include <stdexcept>
#include <cctype>

namespace pattern_harness {
namespace examples {

namespace {
    class Number : public Expression {
    public:
        explicit Number(long long v) : value_(v) {}
        long long interpret() const override { return value_; }
        std::string to_string() const override { return std::to_string(value_); }
    private:
        long long value_;
    };

    class Binary : public Expression {
    public:
        Binary(char op, ExpressionPtr lhs, ExpressionPtr rhs) : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}
        long long interpret() const override {
            long long a = lhs_->interpret();
            long long b = rhs_->interpret();
            switch(op_) {
                case '+': return a + b;
                case '-': return a - b;
                case '*': return a * b;
                case '/':
                    if(b == 0) throw std::domain_error("division by zero");
                    return a / b;
            }
            throw std::logic_error(std::string("unknown operator ") + op_);
        }
        std::string to_string() const override {
            return "(" + lhs_->to_string() + " " + op_ + " " + rhs_->to_string() + ")";
        }
    private:
        char op_;
        ExpressionPtr lhs_;
        ExpressionPtr rhs_;
    };

    bool is_number(const std::string& tok) {
        if(tok.empty()) return false;
        std::size_t i = (tok[0] == '-' && tok.size() > 1) ? 1 : 0;
        for(; i < tok.size(); ++i) if(!std::isdigit(static_cast<unsigned char>(tok[i]))) return false;
        return true;
    }

    const char* kPrograms[] = {"3 4 + 2 *", "10 2 8 * + 3 -"};
}

ExpressionPtr parse_postfix(const std::string& source) {
    std::istringstream iss(source);
    std::vector<ExpressionPtr> stack;
    std::string tok;
    while(iss >> tok) {
        if(is_number(tok)) {
            stack.push_back(std::make_unique<Number>(std::stoll(tok)));
        } else if(tok.size() == 1 && std::string("+-*/").find(tok[0]) != std::string::npos) {
            if(stack.size() < 2) throw std::invalid_argument("operator " + tok + " lacks operands");
            ExpressionPtr rhs = std::move(stack.back()); stack.pop_back();
            ExpressionPtr lhs = std::move(stack.back()); stack.pop_back();
            stack.push_back(std::make_unique<Binary>(tok[0], std::move(lhs), std::move(rhs)));
        } else {
            throw std::invalid_argument("unknown token: " + tok);
        }
    }
    if(stack.size() != 1) throw std::invalid_argument("expression does not reduce to a single value: " + source);
    return std::move(stack.back());
}

void InterpreterExample::setup() {
    programs_.clear();
    for(const char* src : kPrograms) {
        try {
            programs_.push_back(parse_postfix(src));
        } catch(const std::invalid_argument& ex) {
            throw SetupError(std::string("cannot parse program: ") + ex.what());
        }
    }
}

std::vector<std::string> InterpreterExample::run() {
    std::vector<std::string> out;
    for(const auto& p : programs_) {
        out.push_back("expression: " + p->to_string());
        out.push_back("result: " + std::to_string(p->interpret()));
    }
    return out;
}

}
}
