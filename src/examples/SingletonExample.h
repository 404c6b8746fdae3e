#pragma once
#include "../core/Example.h"
#include <string>

namespace pattern_harness {
namespace examples {

// Process-scoped shared value. Constructed exactly once, even under concurrent first access.
class President {
public:
    static President& instance();
    static int constructions();

    const std::string& name() const { return name_; }

    President(const President&) = delete;
    President& operator=(const President&) = delete;

private:
    President();
    std::string name_;
};

class SingletonExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Singleton", "Ensure a class has only one instance and a global access point to it"};
    }
};

}
}
