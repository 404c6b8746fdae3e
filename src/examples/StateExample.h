#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class WritingState {
public:
    virtual ~WritingState() = default;
    virtual std::string write(const std::string& words) const = 0;
};

// Behaviour of write() changes with the current state object.
class TextEditor {
public:
    explicit TextEditor(std::unique_ptr<WritingState> state) : state_(std::move(state)) {}
    void set_state(std::unique_ptr<WritingState> state) { state_ = std::move(state); }
    std::string type(const std::string& words) const { return state_->write(words); }

private:
    std::unique_ptr<WritingState> state_;
};

class StateExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"State", "Let an object alter its behavior when its internal state changes"};
    }
};

}
}
