#include "CommandExample.h"

namespace pattern_harness {
namespace examples {

namespace {
    class TurnOn : public Command {
    public:
        explicit TurnOn(Bulb& bulb) : bulb_(bulb) {}
        std::string execute() override { return bulb_.turn_on(); }
        std::string undo() override { return bulb_.turn_off(); }
    private:
        Bulb& bulb_;
    };

    class TurnOff : public Command {
    public:
        explicit TurnOff(Bulb& bulb) : bulb_(bulb) {}
        std::string execute() override { return bulb_.turn_off(); }
        std::string undo() override { return bulb_.turn_on(); }
    private:
        Bulb& bulb_;
    };
}

std::string RemoteControl::submit(std::unique_ptr<Command> cmd) {
    std::string r = cmd->execute();
    history_.push_back(std::move(cmd));
    return r;
}

std::string RemoteControl::undo() {
    if(history_.empty()) return "nothing to undo";
    std::string r = history_.back()->undo();
    history_.pop_back();
    return r;
}

std::vector<std::string> CommandExample::run() {
    Bulb bulb;
    RemoteControl remote;
    std::vector<std::string> out;
    out.push_back(remote.submit(std::make_unique<TurnOn>(bulb)));
    out.push_back(remote.submit(std::make_unique<TurnOff>(bulb)));
    out.push_back(remote.undo());
    out.push_back(remote.undo());
    out.push_back(remote.undo());
    return out;
}

}
}
