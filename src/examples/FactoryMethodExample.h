#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Interviewer {
public:
    virtual ~Interviewer() = default;
    virtual std::string ask_questions() const = 0;
};

// take_interview() is fixed; which Interviewer it uses is left to make_interviewer().
class HiringManager {
public:
    virtual ~HiringManager() = default;
    std::string take_interview() const { return title() + ": " + make_interviewer()->ask_questions(); }

protected:
    virtual std::unique_ptr<Interviewer> make_interviewer() const = 0;
    virtual std::string title() const = 0;
};

class FactoryMethodExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"FactoryMethod", "Let subclasses decide which class to instantiate"};
    }

private:
    std::vector<std::unique_ptr<HiringManager>> managers_;
};

}
}
