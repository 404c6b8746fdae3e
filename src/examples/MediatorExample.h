#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class ChatUser;

// Users talk only to the room; the room decides how a message is delivered.
class ChatRoom {
public:
    void show_message(const ChatUser& sender, const std::string& message);
    const std::vector<std::string>& transcript() const { return transcript_; }

private:
    std::vector<std::string> transcript_;
};

class ChatUser {
public:
    ChatUser(std::string name, ChatRoom& room) : name_(std::move(name)), room_(room) {}
    const std::string& name() const { return name_; }
    void send(const std::string& message) { room_.show_message(*this, message); }

private:
    std::string name_;
    ChatRoom& room_;
};

class MediatorExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Mediator", "Define an object that encapsulates how a set of objects interact"};
    }
};

}
}
