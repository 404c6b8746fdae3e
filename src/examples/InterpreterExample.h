#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// Integer arithmetic AST.
class Expression {
public:
    virtual ~Expression() = default;
    virtual long long interpret() const = 0;
    virtual std::string to_string() const = 0;
};

using ExpressionPtr = std::unique_ptr<Expression>;

// Builds an AST from space separated postfix tokens ("3 4 + 2 *").
// Throws std::invalid_argument on malformed input or unknown tokens.
ExpressionPtr parse_postfix(const std::string& source);

class InterpreterExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Interpreter", "Represent a grammar and interpret sentences in that language"};
    }

private:
    std::vector<ExpressionPtr> programs_;
};

}
}
