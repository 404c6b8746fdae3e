#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace pattern_harness {

enum class Category { Creational, Structural, Behavioral };

const char* category_name(Category c);
// Accepts creational|structural|behavioral, case-insensitive.
std::optional<Category> parse_category(const std::string& name);

struct ExampleInfo {
    std::string name;
    std::string intent; // one line
};

// The uniform contract every pattern demonstration implements.
class Example {
public:
    virtual ~Example() = default;
    // Wires collaborators. Idempotent; throws SetupError if a collaborator is unavailable.
    virtual void setup() = 0;
    // Executes the scenario and returns the lines it produced. Deterministic.
    virtual std::vector<std::string> run() = 0;
    virtual ExampleInfo describe() const = 0;
};

using ExamplePtr = std::unique_ptr<Example>;
using ExampleFactory = std::function<ExamplePtr()>;

// Registration record; immutable once inside the registry.
struct ExampleSpec {
    std::string name;
    Category category = Category::Behavioral;
    ExampleFactory factory;
    std::optional<std::vector<std::string>> expected_outcome;
};

}
