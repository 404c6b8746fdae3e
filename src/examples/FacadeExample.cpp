#include "FacadeExample.h"

namespace pattern_harness {
namespace examples {

void ComputerFacade::turn_on(std::vector<std::string>& out) const {
    computer_.electric_shock(out);
    computer_.make_sound(out);
    computer_.show_loading_screen(out);
    computer_.bam(out);
}

void ComputerFacade::turn_off(std::vector<std::string>& out) const {
    computer_.close_everything(out);
    computer_.pull_current(out);
    computer_.sooth(out);
}

std::vector<std::string> FacadeExample::run() {
    Computer computer;
    ComputerFacade facade(computer);
    std::vector<std::string> out;
    facade.turn_on(out);
    facade.turn_off(out);
    return out;
}

}
}
