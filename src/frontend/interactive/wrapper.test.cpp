#include <iostream>
#include <string>

#include "frontend/interactive/wrapper.hpp"

using namespace kiln::frontend::interactive;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ":\n" + detail) << "\n";
        ++failures;
    }
}

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

static Decl val_decl(const std::string& name, const std::string& init) {
    Decl decl;
    decl.code = "val " + name + " = " + init;
    decl.display.push_back(DisplayItem::identity(name));
    return decl;
}

static void test_display_code() {
    std::vector<DisplayItem> items = {
        DisplayItem::identity("x"),
        DisplayItem::lazy_identity("y"),
        DisplayItem::definition("function", "f"),
        DisplayItem::import("cmd0.{a => b}"),
    };
    std::string code = default_display_code(items, "cmd4");
    std::string expected =
        "\"x = \" ++ show(cmd4.x) ++ \"\\n\" ++ \"y = <lazy>\" ++ \"\\n\" ++ "
        "\"defined function f\" ++ \"\\n\" ++ \"import cmd0.{a => b}\"";
    expect(code == expected, "display_code", code);
    expect(default_display_code({}, "cmd4") == "\"\"", "display_code.empty");
}

static void test_flat_wrapping() {
    Wrapper wrapper(WrapMode::Object);
    WrappedUnit unit = wrapper.wrap({val_decl("x", "1")}, "import cmd0.a\n", "cmd-1");

    expect(unit.wrapper_name == "cmd_1" && unit.user_prefix == "cmd_1" && !unit.class_wrapped, "flat.names");
    // the flat preamble sits outside the exported module
    expect(unit.carried_imports == 0, "flat.nothing_carried");
    expect(unit.source.rfind("import cmd0.a\n", 0) == 0, "flat.preamble_first", unit.source);
    expect(contains(unit.source, "module cmd_1$Main {\ndef $main(): Str = \"x = \" ++ show(cmd_1.x)\n}"),
           "flat.main", unit.source);
    expect(contains(unit.source, "export module cmd_1 {\nval x = 1\n}"), "flat.body", unit.source);
}

static void test_class_wrapping() {
    Wrapper wrapper(WrapMode::Class);
    WrappedUnit unit = wrapper.wrap({val_decl("x", "1")}, "import cmd0.a\n", "cmd3");

    expect(unit.class_wrapped && unit.user_prefix == "cmd3.INSTANCE", "class.names");
    expect(contains(unit.source, "module cmd3 {\nval INSTANCE = new cmd3$User\n}"), "class.instance", unit.source);
    expect(contains(unit.source, "export class cmd3$User {\nimport cmd0.a\nval x = 1\n}"), "class.body", unit.source);
    expect(contains(unit.source, "show(cmd3.INSTANCE.x)"), "class.display", unit.source);
    expect(unit.carried_imports == 1, "class.carried_imports");

    WrappedUnit two = wrapper.wrap({val_decl("y", "2")}, "import cmd0.a\nimport cmd1.INSTANCE.b._\n", "cmd4");
    expect(two.carried_imports == 2, "class.carried_imports_counted");
    expect(wrapper.wrap({val_decl("y", "2")}, "", "cmd4").carried_imports == 0, "class.no_preamble");
}

static void test_flat_escape() {
    Wrapper wrapper(WrapMode::Class);
    Decl marker;
    marker.code = "import special.wrap.obj";
    marker.display.push_back(DisplayItem::import(kFlatEscapeImport));

    WrappedUnit unit = wrapper.wrap({marker, val_decl("x", "2")}, "", "cmd3");
    expect(unit.wrapper_name == "specialObjCmd3" && !unit.class_wrapped, "escape.name");
    expect(!contains(unit.source, "special.wrap.obj"), "escape.marker_dropped", unit.source);
    expect(contains(unit.source, "export module specialObjCmd3 {\nval x = 2\n}"), "escape.body", unit.source);

    // the escaped wrapper and the regular one of the same line never collide
    WrappedUnit regular = wrapper.wrap({val_decl("x", "2")}, "", "cmd3");
    expect(regular.wrapper_name != unit.wrapper_name, "escape.unique");

    Wrapper flat(WrapMode::Object);
    expect(flat.wrap({marker}, "", "cmd3").wrapper_name == "cmd3", "escape.flat_mode_ignores");
}

static void test_custom_display() {
    Wrapper wrapper(WrapMode::Object, [](const std::vector<DisplayItem>& items, const std::string&) {
        return "\"" + std::to_string(items.size()) + " items\"";
    });
    WrappedUnit unit = wrapper.wrap({val_decl("a", "1"), val_decl("b", "2")}, "", "cmd0");
    expect(contains(unit.source, "def $main(): Str = \"2 items\""), "custom_display", unit.source);
}

int main() {
    test_display_code();
    test_flat_wrapping();
    test_class_wrapping();
    test_flat_escape();
    test_custom_display();

    if (failures) {
        std::cerr << failures << " wrapper test(s) failed\n";
        return 1;
    }
    std::cout << "wrapper tests passed\n";
    return 0;
}
