#include "BridgeExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

namespace {
    class DarkTheme : public Theme {
    public:
        std::string color() const override { return "dark black"; }
    };
    class LightTheme : public Theme {
    public:
        std::string color() const override { return "off white"; }
    };

    class AboutPage : public WebPage {
    public:
        using WebPage::WebPage;
        std::string content() const override { return "about page in " + theme_.color(); }
    };
    class CareersPage : public WebPage {
    public:
        using WebPage::WebPage;
        std::string content() const override { return "careers page in " + theme_.color(); }
    };
}

void BridgeExample::setup() {
    dark_ = std::make_unique<DarkTheme>();
    light_ = std::make_unique<LightTheme>();
}

std::vector<std::string> BridgeExample::run() {
    if(!dark_ || !light_) throw std::logic_error("setup() not called");
    AboutPage about(*dark_);
    CareersPage careers(*light_);
    AboutPage about_light(*light_);
    return {about.content(), careers.content(), about_light.content()};
}

}
}
