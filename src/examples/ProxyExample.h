#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Door {
public:
    virtual ~Door() = default;
    virtual std::string open() = 0;
    virtual std::string close() = 0;
};

// Guards a Door behind a password check.
class SecuredDoor {
public:
    SecuredDoor(std::unique_ptr<Door> door, std::string password) : door_(std::move(door)), password_(std::move(password)) {}
    std::string open(const std::string& password);
    std::string close() { return door_->close(); }

private:
    std::unique_ptr<Door> door_;
    std::string password_;
};

class ProxyExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Proxy", "Provide a surrogate that controls access to another object"};
    }

private:
    std::unique_ptr<SecuredDoor> door_;
};

}
}
