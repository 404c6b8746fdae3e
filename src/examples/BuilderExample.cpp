#include "BuilderExample.h"

namespace pattern_harness {
namespace examples {

std::string Burger::to_string() const {
    std::string s = "burger size " + std::to_string(size) + ":";
    for(std::size_t i = 0; i < toppings.size(); ++i) {
        s += (i == 0 ? " " : ", ") + toppings[i];
    }
    return s;
}

std::vector<std::string> BuilderExample::run() {
    Burger large = BurgerBuilder(14).add_cheese().add_pepperoni().add_lettuce().build();
    Burger small = BurgerBuilder(10).add_tomato().build();
    return {large.to_string(), small.to_string()};
}

}
}
