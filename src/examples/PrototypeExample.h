#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Sheep {
public:
    Sheep(std::string name, std::string category) : name_(std::move(name)), category_(std::move(category)) {}

    std::unique_ptr<Sheep> clone() const { return std::make_unique<Sheep>(*this); }

    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }
    const std::string& category() const { return category_; }

private:
    std::string name_;
    std::string category_;
};

class PrototypeExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Prototype", "Create new objects by copying an existing instance"};
    }

private:
    std::unique_ptr<Sheep> original_;
};

}
}
