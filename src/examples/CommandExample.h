#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// Receiver
class Bulb {
public:
    std::string turn_on() { lit_ = true; return "bulb has been lit"; }
    std::string turn_off() { lit_ = false; return "darkness!"; }
    bool lit() const { return lit_; }

private:
    bool lit_ = false;
};

class Command {
public:
    virtual ~Command() = default;
    virtual std::string execute() = 0;
    virtual std::string undo() = 0;
};

// Invoker with an undo history.
class RemoteControl {
public:
    std::string submit(std::unique_ptr<Command> cmd);
    std::string undo();
    std::size_t history_size() const { return history_.size(); }

private:
    std::vector<std::unique_ptr<Command>> history_;
};

class CommandExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Command", "Encapsulate a request as an object, allowing queuing and undo"};
    }
};

}
}
