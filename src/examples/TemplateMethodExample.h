#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// build() fixes the order of the steps; platforms only fill them in.
class AppBuilder {
public:
    virtual ~AppBuilder() = default;
    void build(std::vector<std::string>& out) const;

protected:
    virtual std::string platform() const = 0;
    virtual std::string deploy_target() const = 0;
};

class TemplateMethodExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"TemplateMethod", "Define the skeleton of an algorithm and defer some steps to subclasses"};
    }

private:
    std::vector<std::unique_ptr<AppBuilder>> builders_;
};

}
}
