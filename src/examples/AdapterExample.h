#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Lion {
public:
    virtual ~Lion() = default;
    virtual std::string roar() const = 0;
};

// Incompatible interface the hunter cannot use directly.
class WildDog {
public:
    std::string bark() const { return "wild dog barks"; }
};

class WildDogAdapter : public Lion {
public:
    explicit WildDogAdapter(WildDog dog) : dog_(dog) {}
    std::string roar() const override { return dog_.bark() + " (adapted)"; }

private:
    WildDog dog_;
};

class AdapterExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Adapter", "Convert the interface of a class into one that clients expect"};
    }

private:
    std::vector<std::unique_ptr<Lion>> game_;
};

}
}
