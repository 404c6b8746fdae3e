#include "MediatorExample.h"

namespace pattern_harness {
namespace examples {

void ChatRoom::show_message(const ChatUser& sender, const std::string& message) {
    transcript_.push_back(sender.name() + ": " + message);
}

std::vector<std::string> MediatorExample::run() {
    ChatRoom room;
    ChatUser john("John", room);
    ChatUser jane("Jane", room);
    john.send("Hi there!");
    jane.send("Hey!");
    return room.transcript();
}

}
}
