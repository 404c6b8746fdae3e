#include "FactoryMethodExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class Developer : public Interviewer {
    public:
        std::string ask_questions() const override { return "asking about design patterns"; }
    };
    class CommunityExecutive : public Interviewer {
    public:
        std::string ask_questions() const override { return "asking about community building"; }
    };

    class DevelopmentManager : public HiringManager {
    protected:
        std::unique_ptr<Interviewer> make_interviewer() const override { return std::make_unique<Developer>(); }
        std::string title() const override { return "development manager"; }
    };
    class MarketingManager : public HiringManager {
    protected:
        std::unique_ptr<Interviewer> make_interviewer() const override { return std::make_unique<CommunityExecutive>(); }
        std::string title() const override { return "marketing manager"; }
    };
}

void FactoryMethodExample::setup() {
    managers_.clear();
    managers_.push_back(std::make_unique<DevelopmentManager>());
    managers_.push_back(std::make_unique<MarketingManager>());
}

std::vector<std::string> FactoryMethodExample::run() {
    std::vector<std::string> out;
    for(const auto& m : managers_) out.push_back(m->take_interview());
    return out;
}

}
}
