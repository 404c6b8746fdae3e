#include "Example.h"
#include <algorithm>
#include <cctype>

namespace pattern_harness {

const char* category_name(Category c) {
    switch(c) {
        case Category::Creational: return "Creational";
        case Category::Structural: return "Structural";
        case Category::Behavioral: return "Behavioral";
    }
    return "Unknown";
}

std::optional<Category> parse_category(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s == "creational") return Category::Creational;
    if(s == "structural") return Category::Structural;
    if(s == "behavioral" || s == "behavioural") return Category::Behavioral;
    return std::nullopt;
}

}
