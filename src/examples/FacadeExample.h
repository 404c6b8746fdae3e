#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class Computer {
public:
    void electric_shock(std::vector<std::string>& out) const { out.push_back("ouch!"); }
    void make_sound(std::vector<std::string>& out) const { out.push_back("beep beep!"); }
    void show_loading_screen(std::vector<std::string>& out) const { out.push_back("loading.."); }
    void bam(std::vector<std::string>& out) const { out.push_back("ready to be used!"); }
    void close_everything(std::vector<std::string>& out) const { out.push_back("bup bup bup buzzzz!"); }
    void sooth(std::vector<std::string>& out) const { out.push_back("zzzzz"); }
    void pull_current(std::vector<std::string>& out) const { out.push_back("haaah!"); }
};

// Two calls instead of seven.
class ComputerFacade {
public:
    explicit ComputerFacade(Computer& computer) : computer_(computer) {}
    void turn_on(std::vector<std::string>& out) const;
    void turn_off(std::vector<std::string>& out) const;

private:
    Computer& computer_;
};

class FacadeExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Facade", "Provide a simplified interface to a complex subsystem"};
    }
};

}
}
