#include "IteratorExample.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace pattern_harness {
namespace examples {

std::size_t StationList::remove(double frequency) {
    auto before = stations_.size();
    stations_.erase(std::remove_if(stations_.begin(), stations_.end(),
        [&](const RadioStation& s){ return s.frequency() == frequency; }), stations_.end());
    return before - stations_.size();
}

void IteratorExample::setup() {
    stations_ = StationList();
    for(double f : {89.0, 101.0, 102.0, 103.2}) stations_.add(RadioStation(f));
}

std::vector<std::string> IteratorExample::run() {
    std::vector<std::string> out;
    StationList tuned = stations_;
    std::size_t removed = tuned.remove(89.0);
    out.push_back("removed: " + std::to_string(removed));
    for(const auto& s : tuned) {
        std::ostringstream os;
        os << "station " << std::fixed << std::setprecision(1) << s.frequency();
        out.push_back(os.str());
    }
    out.push_back("stations: " + std::to_string(tuned.size()));
    return out;
}

}
}
