#pragma once
#include "../core/Example.h"
#include <map>
#include <cstdint>

namespace pattern_harness {
namespace examples {

// Intrinsic state shared between every circle of the same color.
struct CircleStyle {
    std::string color;
};

class CircleStyleFactory {
public:
    const CircleStyle& get(const std::string& color);
    std::size_t size() const { return cache_.size(); }
    void clear() { cache_.clear(); }

private:
    std::map<std::string, std::unique_ptr<CircleStyle>> cache_;
};

// Colors are picked from a DeterministicSource seeded at construction.
class FlyweightExample : public Example {
public:
    explicit FlyweightExample(std::uint32_t seed) : seed_(seed) {}

    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Flyweight", "Share fine-grained objects to support large numbers of them efficiently"};
    }

    static const std::vector<std::string>& palette();
    static constexpr int kCircles = 8;

private:
    std::uint32_t seed_;
    CircleStyleFactory styles_;
};

}
}
