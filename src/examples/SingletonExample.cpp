#include "SingletonExample.h"
#include <mutex>
#include <atomic>

namespace pattern_harness {
namespace examples {

namespace {
    std::once_flag president_once;
    President* president_instance = nullptr;
    std::atomic<int> president_constructions{0};
}

President::President() : name_("the president") {
    ++president_constructions;
}

President& President::instance() {
    // Intentionally leaked; lives until process exit.
    std::call_once(president_once, []{ president_instance = new President(); });
    return *president_instance;
}

int President::constructions() {
    return president_constructions.load();
}

std::vector<std::string> SingletonExample::run() {
    President& first = President::instance();
    President& second = President::instance();
    return {std::string("instance-1==instance-2: ") + (&first == &second ? "true" : "false")};
}

}
}
