#include "AbstractFactoryExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class WindowsButton : public Button {
    public:
        std::string paint() const override { return "windows button rendered"; }
    };
    class WindowsCheckbox : public Checkbox {
    public:
        std::string paint() const override { return "windows checkbox rendered"; }
    };
    class MacButton : public Button {
    public:
        std::string paint() const override { return "mac button rendered"; }
    };
    class MacCheckbox : public Checkbox {
    public:
        std::string paint() const override { return "mac checkbox rendered"; }
    };

    class WindowsFactory : public WidgetFactory {
    public:
        std::unique_ptr<Button> make_button() const override { return std::make_unique<WindowsButton>(); }
        std::unique_ptr<Checkbox> make_checkbox() const override { return std::make_unique<WindowsCheckbox>(); }
    };
    class MacFactory : public WidgetFactory {
    public:
        std::unique_ptr<Button> make_button() const override { return std::make_unique<MacButton>(); }
        std::unique_ptr<Checkbox> make_checkbox() const override { return std::make_unique<MacCheckbox>(); }
    };
}

void AbstractFactoryExample::setup() {
    if(!factories_.empty()) return;
    factories_.push_back(std::make_unique<WindowsFactory>());
    factories_.push_back(std::make_unique<MacFactory>());
}

std::vector<std::string> AbstractFactoryExample::run() {
    std::vector<std::string> out;
    // client code only sees WidgetFactory
    for(const auto& f : factories_) {
        out.push_back(f->make_button()->paint());
        out.push_back(f->make_checkbox()->paint());
    }
    return out;
}

}
}
