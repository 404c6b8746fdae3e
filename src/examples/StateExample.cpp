#include "StateExample.h"
#include <algorithm>
#include <cctype>

namespace pattern_harness {
namespace examples {

namespace {
    class DefaultState : public WritingState {
    public:
        std::string write(const std::string& words) const override { return words; }
    };

    class UpperCase : public WritingState {
    public:
        std::string write(const std::string& words) const override {
            std::string s = words;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
            return s;
        }
    };

    class LowerCase : public WritingState {
    public:
        std::string write(const std::string& words) const override {
            std::string s = words;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return s;
        }
    };
}

std::vector<std::string> StateExample::run() {
    TextEditor editor(std::make_unique<DefaultState>());
    std::vector<std::string> out;
    out.push_back(editor.type("First line"));
    editor.set_state(std::make_unique<UpperCase>());
    out.push_back(editor.type("Second line"));
    out.push_back(editor.type("Third line"));
    editor.set_state(std::make_unique<LowerCase>());
    out.push_back(editor.type("Fourth line"));
    editor.set_state(std::make_unique<DefaultState>());
    out.push_back(editor.type("Fifth line"));
    return out;
}

}
}
