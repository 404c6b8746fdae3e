#pragma once
#include <random>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

namespace pattern_harness {
namespace examples {

// Injected stand-in for randomness. std::minstd_rand has a standardized sequence,
// so a given seed yields the same picks on every platform.
class DeterministicSource {
public:
    explicit DeterministicSource(std::uint32_t seed) : engine_(seed) {}

    // Value in [0, bound). Throws std::invalid_argument for an empty range.
    std::size_t next(std::size_t bound) {
        if(bound == 0) throw std::invalid_argument("DeterministicSource::next: bound must be positive");
        return static_cast<std::size_t>(engine_() % bound);
    }

private:
    std::minstd_rand engine_;
};

}
}
