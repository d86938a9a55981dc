#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "frontend/interactive/declaration.hpp"

namespace kiln::frontend::interactive {

enum class WrapMode {
    // declarations become members of an exported module
    Object,
    // declarations become members of an instance held by a module
    Class,
};

// Path of the import that asks for a flat wrapper inside a class-wrapped session.
constexpr const char* kFlatEscapeImport = "special.wrap.obj";

// Str-typed expression shown after a fragment ran, given its display items
// and the path its members are reachable under.
using DisplayCode = std::function<std::string(const std::vector<DisplayItem>&, const std::string& user_prefix)>;

std::string default_display_code(const std::vector<DisplayItem>& items, const std::string& user_prefix);

struct WrappedUnit {
    std::string wrapper_name;
    std::string source;
    // path later fragments import the unit's members from
    std::string user_prefix;
    bool class_wrapped = false;
    // preamble imports placed inside the exported container; they come
    // first among its exports and are not the fragment's own
    std::size_t carried_imports = 0;
};

/**
 * Wrapper
 *
 * Turns the declarations of one fragment plus the import preamble into a
 * compilation unit. The unit always holds `<name>$Main` with a nullary
 * `$main` returning the display text.
 */
class Wrapper {
public:
    explicit Wrapper(WrapMode mode, DisplayCode display = default_display_code);

    WrappedUnit wrap(const std::vector<Decl>& decls, const std::string& preamble, const std::string& candidate_name) const;

    WrapMode mode() const { return mode_; }

    // "cmd-1" -> "cmd_1"
    static std::string sanitize(const std::string& name);

private:
    WrappedUnit wrap_flat(const std::vector<Decl>& decls, const std::string& preamble, const std::string& name) const;
    WrappedUnit wrap_class(const std::vector<Decl>& decls, const std::string& preamble, const std::string& name) const;

    WrapMode mode_;
    DisplayCode display_;
};

} // namespace kiln::frontend::interactive
