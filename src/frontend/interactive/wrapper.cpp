#include "frontend/interactive/wrapper.hpp"

#include <algorithm>
#include <cctype>

namespace kiln::frontend::interactive {

namespace {

std::string join_code(const std::vector<Decl>& decls) {
    std::string code;
    for (const auto& decl : decls) {
        code += decl.code;
        code += "\n";
    }
    return code;
}

std::vector<DisplayItem> display_items(const std::vector<Decl>& decls) {
    std::vector<DisplayItem> items;
    for (const auto& decl : decls) {
        items.insert(items.end(), decl.display.begin(), decl.display.end());
    }
    return items;
}

bool has_flat_escape(const Decl& decl) {
    return std::any_of(decl.display.begin(), decl.display.end(), [](const DisplayItem& item) {
        return item.kind == DisplayItem::Kind::Import && item.name == kFlatEscapeImport;
    });
}

std::string string_literal(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

} // namespace

std::string default_display_code(const std::vector<DisplayItem>& items, const std::string& user_prefix) {
    std::vector<std::string> parts;
    for (const auto& item : items) {
        switch (item.kind) {
            case DisplayItem::Kind::Definition:
                parts.push_back(string_literal("defined " + item.label + " " + item.name));
                break;
            case DisplayItem::Kind::Import:
                parts.push_back(string_literal("import " + item.name));
                break;
            case DisplayItem::Kind::Identity:
                parts.push_back(string_literal(item.name + " = ") + " ++ show(" + user_prefix + "." + item.name + ")");
                break;
            case DisplayItem::Kind::LazyIdentity:
                parts.push_back(string_literal(item.name + " = <lazy>"));
                break;
        }
    }
    if (parts.empty()) {
        return "\"\"";
    }

    std::string code = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        code += " ++ \"\\n\" ++ " + parts[i];
    }
    return code;
}

Wrapper::Wrapper(WrapMode mode, DisplayCode display) : mode_(mode), display_(std::move(display)) {}

std::string Wrapper::sanitize(const std::string& name) {
    std::string out = name;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

WrappedUnit Wrapper::wrap(const std::vector<Decl>& decls, const std::string& preamble, const std::string& candidate_name) const {
    std::string name = sanitize(candidate_name);
    if (mode_ == WrapMode::Object) {
        return wrap_flat(decls, preamble, name);
    }

    if (std::any_of(decls.begin(), decls.end(), has_flat_escape)) {
        std::vector<Decl> kept;
        std::copy_if(decls.begin(), decls.end(), std::back_inserter(kept), [](const Decl& d) { return !has_flat_escape(d); });
        std::string capitalized = name;
        if (!capitalized.empty()) {
            capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));
        }
        return wrap_flat(kept, preamble, "specialObj" + capitalized);
    }
    return wrap_class(decls, preamble, name);
}

WrappedUnit Wrapper::wrap_flat(const std::vector<Decl>& decls, const std::string& preamble, const std::string& name) const {
    WrappedUnit unit;
    unit.wrapper_name = name;
    unit.user_prefix = name;
    unit.class_wrapped = false;

    std::string display = display_(display_items(decls), unit.user_prefix);
    unit.source = preamble + "\n" +
        "module " + name + "$Main {\n" +
        "def $main(): Str = " + display + "\n" +
        "}\n" +
        "export module " + name + " {\n" +
        join_code(decls) +
        "}\n";
    return unit;
}

WrappedUnit Wrapper::wrap_class(const std::vector<Decl>& decls, const std::string& preamble, const std::string& name) const {
    WrappedUnit unit;
    unit.wrapper_name = name;
    unit.user_prefix = name + ".INSTANCE";
    unit.class_wrapped = true;
    unit.carried_imports = static_cast<std::size_t>(std::count(preamble.begin(), preamble.end(), '\n'));

    std::string display = display_(display_items(decls), unit.user_prefix);
    unit.source =
        "module " + name + "$Main {\n" +
        preamble +
        "def $main(): Str = " + display + "\n" +
        "}\n" +
        "module " + name + " {\n" +
        "val INSTANCE = new " + name + "$User\n" +
        "}\n" +
        "export class " + name + "$User {\n" +
        preamble +
        join_code(decls) +
        "}\n";
    return unit;
}

} // namespace kiln::frontend::interactive
