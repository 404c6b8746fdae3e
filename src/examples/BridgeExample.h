#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Theme {
public:
    virtual ~Theme() = default;
    virtual std::string color() const = 0;
};

// Abstraction side of the bridge; holds the implementation by reference.
class WebPage {
public:
    explicit WebPage(const Theme& theme) : theme_(theme) {}
    virtual ~WebPage() = default;
    virtual std::string content() const = 0;

protected:
    const Theme& theme_;
};

class BridgeExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Bridge", "Decouple an abstraction from its implementation so both can vary"};
    }

private:
    std::unique_ptr<Theme> dark_;
    std::unique_ptr<Theme> light_;
};

}
}
