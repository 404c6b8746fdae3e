#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

class RadioStation {
public:
    explicit RadioStation(double frequency) : frequency_(frequency) {}
    double frequency() const { return frequency_; }

private:
    double frequency_;
};

// Collection exposing traversal without exposing its storage.
class StationList {
public:
    using const_iterator = std::vector<RadioStation>::const_iterator;

    void add(RadioStation station) { stations_.push_back(station); }
    // Removes every station on the given frequency; returns how many were removed.
    std::size_t remove(double frequency);
    std::size_t size() const { return stations_.size(); }

    const_iterator begin() const { return stations_.begin(); }
    const_iterator end() const { return stations_.end(); }

private:
    std::vector<RadioStation> stations_;
};

class IteratorExample : public Example {
public:
    void setup() override;
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Iterator", "Access elements of a collection sequentially without exposing its representation"};
    }

private:
    StationList stations_;
};

}
}
