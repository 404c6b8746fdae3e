#include "ProxyExample.h"
#include <stdexcept>

namespace pattern_harness {
namespace examples {

namespace {
    class LabDoor : public Door {
    public:
        std::string open() override { return "lab door opened"; }
        std::string close() override { return "lab door closed"; }
    };
}

std::string SecuredDoor::open(const std::string& password) {
    if(password != password_) return "wrong password: access denied";
    return door_->open();
}

void ProxyExample::setup() {
    if(door_) return;
    door_ = std::make_unique<SecuredDoor>(std::make_unique<LabDoor>(), "$ecr@t");
}

std::vector<std::string> ProxyExample::run() {
    if(!door_) throw std::logic_error("setup() not called");
    return {door_->open("invalid"), door_->open("$ecr@t"), door_->close()};
}

}
}
