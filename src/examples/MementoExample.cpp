#include "MementoExample.h"

namespace pattern_harness {
namespace examples {

std::vector<std::string> MementoExample::run() {
    Editor editor;
    editor.type("This is the first sentence.");
    EditorMemento saved = editor.save();
    editor.type(" This is second.");
    std::vector<std::string> out;
    out.push_back("before undo: " + editor.content());
    editor.restore(saved);
    out.push_back("after undo: " + editor.content());
    return out;
}

}
}
