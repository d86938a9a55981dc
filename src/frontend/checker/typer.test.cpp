#include <iostream>
#include <string>

#include "frontend/checker/typer.hpp"
#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"

using namespace kiln::frontend;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ": " + detail) << "\n";
        ++failures;
    }
}

struct Checked {
    std::unique_ptr<ast::Program> program;
    std::vector<std::shared_ptr<ContainerSymbol>> containers;
};

static Checked check(SymbolTable& table, const std::string& source, InlineEvaluator inline_eval = nullptr,
                     ExternChecker extern_check = nullptr) {
    Checked out;
    Parser parser;
    out.program = parser.produce_ast(Lexer(source).tokenize());
    Typer typer(table, std::move(inline_eval), std::move(extern_check));
    out.containers = typer.check(*out.program);
    return out;
}

static std::string error_of(SymbolTable& table, const std::string& source, InlineEvaluator inline_eval = nullptr,
                            ExternChecker extern_check = nullptr) {
    try {
        check(table, source, std::move(inline_eval), std::move(extern_check));
    } catch (const CompileError& e) {
        return e.what();
    }
    return "";
}

static void test_cross_unit_imports() {
    SymbolTable table;
    auto first = check(table, "export module cmd0 { val x = 1\nimplicit def conv(v: Int): Str = \"n\" }");
    table.commit(first.containers);

    auto second = check(table, "import cmd0.{x => y}\nimport cmd0.conv\nmodule cmd1 { val z = y + 1\nval s = \"a\" ++ z }");
    const ast::ImportNode& renamed = *second.program->imports[0];
    const ast::ImportNode& conv = *second.program->imports[1];
    expect(renamed.resolved_prefix == "cmd0" && !renamed.selectors[0].implicit, "cross_unit.renamed");
    expect(conv.selectors[0].implicit, "cross_unit.implicit_flag");

    const MemberSymbol* s = second.containers[0]->find("s");
    expect(s && s->type == Type::str_type(), "cross_unit.implicit_conversion");
}

static void test_uncommitted_units_are_invisible() {
    SymbolTable table;
    check(table, "export module cmd0 { val x = 1 }");
    expect(error_of(table, "import cmd0.x\nmodule cmd1 { val y = x }").find("cmd0") != std::string::npos,
           "uncommitted_invisible");
}

static void test_errors() {
    SymbolTable table;
    expect(error_of(table, "module m { val x = y }") == "not found: y", "errors.not_found");
    expect(error_of(table, "module m { val x: Int = \"s\" }") == "type mismatch: expected Int but found Str",
           "errors.mismatch");
    std::string message = error_of(table, "module m { val x = 1\nval y = x.z }");
    expect(message == "value of type Int has no member z", "errors.no_member", message);
}

static void test_inline_vals() {
    SymbolTable table;
    std::string message = error_of(table, "module m { inline val x = 1 }");
    expect(message == "inline val x could not be evaluated at compile time: compile-time evaluation is not available",
           "inline.no_evaluator", message);

    auto checked = check(table, "module m { inline val x = 6 * 7 }",
                         [](const ast::Expr&, std::string&) -> std::optional<std::int64_t> { return 42; });
    const MemberSymbol* x = checked.containers[0]->find("x");
    expect(x && x->kind == MemberKind::InlineVal && x->constant == 42, "inline.constant");

    message = error_of(table, "module m { inline val x = 1 }",
                       [](const ast::Expr&, std::string& error) -> std::optional<std::int64_t> {
                           error = "boom";
                           return std::nullopt;
                       });
    expect(message == "inline val x could not be evaluated at compile time: boom", "inline.failure", message);
}

static void test_extern_visibility() {
    SymbolTable table;
    auto hidden = [](const std::string&) { return false; };
    expect(error_of(table, "module m { extern def puts(s: Str): Int }", nullptr, hidden) ==
               "extern symbol puts not found on the runtime classpath",
           "extern.hidden");

    auto visible = [](const std::string& symbol) { return symbol == "puts"; };
    expect(error_of(table, "module m { extern def puts(s: Str): Int }", nullptr, visible).empty(), "extern.visible");
}

static void test_classes() {
    SymbolTable table;
    auto checked = check(table, "class Point(x: Int) { def twice(): Int = x * 2 }\nmodule m { val p = new Point(4)\nval t = p.twice() }");
    const ContainerSymbol* point = checked.containers[0].get();
    expect(point->is_class && point->find("twice"), "classes.members");
    const MemberSymbol* p = checked.containers[1]->find("p");
    expect(p && p->type == Type::object_type(point), "classes.object_type");
}

int main() {
    try {
        test_cross_unit_imports();
        test_uncommitted_units_are_invisible();
        test_errors();
        test_inline_vals();
        test_extern_visibility();
        test_classes();
    } catch (const std::exception& e) {
        std::cerr << "FAIL(unexpected exception): " << e.what() << "\n";
        return 1;
    }

    if (failures) {
        std::cerr << failures << " typer test(s) failed\n";
        return 1;
    }
    std::cout << "typer tests passed\n";
    return 0;
}
