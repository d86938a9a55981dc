#include <iostream>
#include <string>

#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"

using namespace kiln::frontend;

static int failures = 0;

static void expect(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")\n";
        ++failures;
    }
}

static std::unique_ptr<ast::Program> parse(const std::string& source) {
    Parser parser;
    return parser.produce_ast(Lexer(source).tokenize());
}

static void test_unit_layout() {
    auto program = parse(
        "import cmd0.{x => y, z}\n"
        "module cmd1$Main {\n"
        "  def $main(): Str = \"\"\n"
        "}\n"
        "export module cmd1 {\n"
        "  implicit def conv(v: Int): Str = \"n\"\n"
        "  lazy val a = 1; inline val b = 2\n"
        "  extern def puts(s: Str): Int\n"
        "}\n");

    expect(program->imports.size() == 1, "unit_layout.imports");
    const ast::ImportNode& import = *program->imports[0];
    expect(import.prefix_text() == "cmd0", "unit_layout.import_prefix");
    expect(import.selectors.size() == 2 && import.selectors[0].alias == "y" && import.selectors[1].alias == "z",
           "unit_layout.selectors");

    expect(program->items.size() == 2, "unit_layout.items");
    expect(!program->items[0]->exported && program->items[1]->exported, "unit_layout.exported");

    const auto& members = program->items[1]->members;
    expect(members.size() == 4, "unit_layout.members");
    const auto& conv = static_cast<const ast::DefNode&>(*members[0]);
    expect(conv.implicit && conv.params.size() == 1, "unit_layout.implicit_def");
    const auto& a = static_cast<const ast::ValNode&>(*members[1]);
    const auto& b = static_cast<const ast::ValNode&>(*members[2]);
    expect(a.lazy && !a.is_inline && b.is_inline, "unit_layout.val_modifiers");
    expect(members[3]->kind == ast::NodeType::Extern, "unit_layout.extern");
}

static void test_wildcard_import() {
    auto program = parse("import cmd2.INSTANCE._\nmodule m { }");
    const ast::ImportNode& import = *program->imports[0];
    expect(import.wildcard && import.selectors.empty(), "wildcard_import");
    expect(import.prefix_text() == "cmd2.INSTANCE", "wildcard_import.prefix");
}

static void test_newline_rules() {
    auto program = parse(
        "module m {\n"
        "  val x = if (1 < 2) 1\n"
        "          else 2\n"
        "  val y = x +\n"
        "    1\n"
        "  val z = cmd0\n"
        "    .x\n"
        "}\n");
    expect(program->items[0]->members.size() == 3, "newline_rules");
}

static void test_class_with_params() {
    auto program = parse("class Point(x: Int, y: Int) { def sum(): Int = x + y }");
    const auto& cls = *program->items[0];
    expect(cls.container_kind == ast::ContainerKind::Class && cls.ctor_params.size() == 2, "class_with_params");
}

static void test_errors() {
    struct Case {
        const char* source;
        const char* message;
    };
    const Case cases[] = {
        {"val x = 1", "expected 'module' or 'class' at top level"},
        {"module m { export module n { } }", "'export' is only allowed on top-level modules and classes"},
        {"module m { lazy inline val x = 1 }", "a val cannot be both 'lazy' and 'inline'"},
        {"module m { val x = { def f = 1 } }", "only 'val' definitions and expressions are allowed inside a block"},
        {"import x\nmodule m { }", "import requires a qualified path"},
    };

    for (const auto& c : cases) {
        bool threw = false;
        try {
            parse(c.source);
        } catch (const CompileError& e) {
            threw = true;
            expect(std::string(e.what()) == c.message, std::string("errors.message: ") + c.source);
        }
        expect(threw, std::string("errors.threw: ") + c.source);
    }
}

int main() {
    try {
        test_unit_layout();
        test_wildcard_import();
        test_newline_rules();
        test_class_with_params();
        test_errors();
    } catch (const std::exception& e) {
        std::cerr << "FAIL(unexpected exception): " << e.what() << "\n";
        return 1;
    }

    if (failures) {
        std::cerr << failures << " parser test(s) failed\n";
        return 1;
    }
    std::cout << "parser tests passed\n";
    return 0;
}
