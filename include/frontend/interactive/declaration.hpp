#pragma once

#include <set>
#include <string>
#include <vector>

namespace kiln::frontend::interactive {

// What a declaration did, for the feedback line printed after it ran.
struct DisplayItem {
    enum class Kind {
        Definition,
        Import,
        Identity,
        LazyIdentity,
    };

    Kind kind;
    // "function", "class" or "module" for definitions
    std::string label;
    // defined or bound name, or the imported path
    std::string name;

    static DisplayItem definition(std::string label, std::string name) { return {Kind::Definition, std::move(label), std::move(name)}; }
    static DisplayItem import(std::string path) { return {Kind::Import, "", std::move(path)}; }
    static DisplayItem identity(std::string name) { return {Kind::Identity, "", std::move(name)}; }
    static DisplayItem lazy_identity(std::string name) { return {Kind::LazyIdentity, "", std::move(name)}; }

    bool operator==(const DisplayItem& other) const {
        return kind == other.kind && label == other.label && name == other.name;
    }
};

// One top-level statement of a fragment.
struct Decl {
    std::string code;
    std::vector<DisplayItem> display;
    // first segments of the paths the statement mentions
    std::set<std::string> referenced_names;
};

} // namespace kiln::frontend::interactive
