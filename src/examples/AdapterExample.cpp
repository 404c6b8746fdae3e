#include "AdapterExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class AfricanLion : public Lion {
    public:
        std::string roar() const override { return "african lion roars"; }
    };
    class AsianLion : public Lion {
    public:
        std::string roar() const override { return "asian lion roars"; }
    };

    std::string hunt(const Lion& lion) { return lion.roar(); }
}

void AdapterExample::setup() {
    if(!game_.empty()) return;
    game_.push_back(std::make_unique<AfricanLion>());
    game_.push_back(std::make_unique<AsianLion>());
    game_.push_back(std::make_unique<WildDogAdapter>(WildDog{}));
}

std::vector<std::string> AdapterExample::run() {
    std::vector<std::string> out;
    for(const auto& l : game_) out.push_back(hunt(*l));
    return out;
}

}
}
