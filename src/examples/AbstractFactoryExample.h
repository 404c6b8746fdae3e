#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Button {
public:
    virtual ~Button() = default;
    virtual std::string paint() const = 0;
};

class Checkbox {
public:
    virtual ~Checkbox() = default;
    virtual std::string paint() const = 0;
};

// One family of related widgets.
class WidgetFactory {
public:
    virtual ~WidgetFactory() = default;
    virtual std::unique_ptr<Button> make_button() const = 0;
    virtual std::unique_ptr<Checkbox> make_checkbox() const = 0;
};

class AbstractFactoryExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"AbstractFactory", "Create families of related objects without naming their concrete classes"};
    }

private:
    std::vector<std::unique_ptr<WidgetFactory>> factories_;
};

}
}
