#pragma once
#include "../core/Example.h"

namespace pattern_harness {
namespace examples {

// Opaque snapshot; only Editor reads it.
class EditorMemento {
public:
    explicit EditorMemento(std::string content) : content_(std::move(content)) {}

private:
    friend class Editor;
    std::string content_;
};

class Editor {
public:
    void type(const std::string& words) { content_ += words; }
    const std::string& content() const { return content_; }
    EditorMemento save() const { return EditorMemento(content_); }
    void restore(const EditorMemento& m) { content_ = m.content_; }

private:
    std::string content_;
};

class MementoExample : public Example {
public:
    void setup() override {}
    std::vector<std::string> run() override;
    ExampleInfo describe() const override {
        return {"Memento", "Capture and restore an object's internal state without violating encapsulation"};
    }
};

}
}
