#include "TemplateMethodExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class AndroidBuilder : public AppBuilder {
    protected:
        std::string platform() const override { return "android"; }
        std::string deploy_target() const override { return "play store"; }
    };

    class IosBuilder : public AppBuilder {
    protected:
        std::string platform() const override { return "ios"; }
        std::string deploy_target() const override { return "app store"; }
    };
}

void AppBuilder::build(std::vector<std::string>& out) const {
    out.push_back("running " + platform() + " tests");
    out.push_back("linting " + platform() + " code");
    out.push_back("assembling " + platform() + " build");
    out.push_back("deploying " + platform() + " build to " + deploy_target());
}

void TemplateMethodExample::setup() {
    builders_.clear();
    builders_.push_back(std::make_unique<AndroidBuilder>());
    builders_.push_back(std::make_unique<IosBuilder>());
}

std::vector<std::string> TemplateMethodExample::run() {
    std::vector<std::string> out;
    for(const auto& b : builders_) b->build(out);
    return out;
}

}
}
