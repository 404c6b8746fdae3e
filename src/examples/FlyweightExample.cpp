#include "FlyweightExample.h"
#include "DeterministicSource.h"

namespace pattern_harness {
namespace examples {

const CircleStyle& CircleStyleFactory::get(const std::string& color) {
    auto it = cache_.find(color);
    if(it == cache_.end()) {
        auto style = std::make_unique<CircleStyle>();
        style->color = color;
        it = cache_.emplace(color, std::move(style)).first;
    }
    return *it->second;
}

const std::vector<std::string>& FlyweightExample::palette() {
    static const std::vector<std::string> colors = {"red", "green", "blue", "white"};
    return colors;
}

void FlyweightExample::setup() {
    // pre-warm with the default color
    styles_.clear();
    styles_.get("red");
}

std::vector<std::string> FlyweightExample::run() {
    DeterministicSource source(seed_);
    const auto& colors = palette();
    std::vector<std::string> out;
    for(int i = 1; i <= kCircles; ++i) {
        const CircleStyle& style = styles_.get(colors[source.next(colors.size())]);
        out.push_back("circle #" + std::to_string(i) + " color=" + style.color);
    }
    out.push_back("flyweights created: " + std::to_string(styles_.size()));
    return out;
}

}
}
