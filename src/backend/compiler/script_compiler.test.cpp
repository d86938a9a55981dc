#include <algorithm>
#include <iostream>
#include <string>

#include "backend/compiler/script_compiler.hpp"

using namespace kiln::backend;
using compiler::CollectingSink;
using compiler::ScriptCompiler;
using kiln::frontend::interactive::ImportEntry;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ":\n" + detail) << "\n";
        ++failures;
    }
}

static const std::string kFixtures = std::string(KILN_SOURCE_DIR) + "/tests/fixtures";

static bool has_export(const std::vector<ImportEntry>& entries, const std::string& local, bool implicit) {
    return std::any_of(entries.begin(), entries.end(), [&](const ImportEntry& e) {
        return e.local == local && e.implicit == implicit && e.prefix.empty();
    });
}

// Compiles `source` and hands its artifacts to the registry, as the interpreter does.
static bool compile_and_load(ScriptCompiler& sc, registry::ArtifactRegistry& reg, const std::string& source,
                             std::string& diagnostics) {
    CollectingSink sink;
    auto output = sc.compile(source, sink);
    diagnostics = sink.render();
    if (!output) return false;
    for (auto& artifact : output->artifacts) {
        if (llvm::Error err = reg.add_artifact(artifact.name, artifact.bytes, artifact.source)) {
            diagnostics = llvm::toString(std::move(err));
            return false;
        }
    }
    return true;
}

static void test_exports_and_artifacts() {
    registry::ArtifactRegistry reg;
    ScriptCompiler sc(reg);
    CollectingSink sink;
    auto output = sc.compile(
        "module cmd0$Main { def $main(): Str = \"\" }\n"
        "export module cmd0 {\n"
        "val x = 1\n"
        "implicit def conv(v: Int): Str = \"n\"\n"
        "class Point(a: Int) { }\n"
        "}\n",
        sink);
    expect(output.has_value(), "exports.compiled", sink.render());
    if (!output) return;

    expect(output->artifacts.size() == 2, "exports.one_artifact_per_container");
    expect(output->artifacts[0].name == "cmd0$Main" && !output->artifacts[0].bytes.empty(), "exports.artifact_bitcode");
    expect(has_export(output->exported, "x", false), "exports.val");
    expect(has_export(output->exported, "conv", true), "exports.implicit_def");
    expect(has_export(output->exported, "Point", false), "exports.class");
    expect(sc.symbols().find_global("cmd0") != nullptr, "exports.committed");
}

static void test_failed_units_commit_nothing() {
    registry::ArtifactRegistry reg;
    ScriptCompiler sc(reg);
    CollectingSink sink;
    auto output = sc.compile("export module cmd1 {\nval a = 1\nval b = missing + 1\n}\n", sink);
    expect(!output, "failure.no_output");
    expect(sink.diagnostics().size() == 1, "failure.one_diagnostic");
    std::string expected = "Main.kiln:3:9: ERROR: not found: missing\n 3 |   val b = missing + 1\n   |   " + std::string(8, ' ') + "^";
    expect(sink.render() == expected, "failure.rendered", sink.render());
    expect(sc.symbols().find_global("cmd1") == nullptr, "failure.not_committed");

    CollectingSink lex_sink;
    expect(!sc.compile("module m { val s = \"open }", lex_sink) && !lex_sink.empty(), "failure.lex_error");
}

static void test_reset() {
    registry::ArtifactRegistry reg;
    ScriptCompiler sc(reg);
    CollectingSink sink;
    sc.compile("export module cmd0 { val x = 1 }", sink);
    sc.reset();
    expect(sc.symbols().global_names().empty(), "reset");
}

static void test_extern_validation() {
    registry::ArtifactRegistry reg;
    ScriptCompiler sc(reg);
    const std::string source = "export module lib { extern def mathlib_triple(x: Int): Int }";

    CollectingSink hidden;
    expect(!sc.compile(source, hidden), "extern.hidden");

    reg.add_paths(registry::ClassLoaderTier::Runtime, {kFixtures + "/classpath"});
    CollectingSink visible;
    expect(sc.compile(source, visible).has_value(), "extern.visible", visible.render());
}

static void test_inline_vals_follow_loader_mode() {
    const std::string first = "export module cmd0 { val a = 5 }";
    const std::string second = "import cmd0.a\nexport module cmd1 { inline val b = a * 2 }";

    {
        registry::ArtifactRegistry reg;
        ScriptCompiler sc(reg);
        std::string diagnostics;
        expect(compile_and_load(sc, reg, "module constants { inline val c = 6 * 7 }", diagnostics), "inline.constant", diagnostics);
        expect(compile_and_load(sc, reg, first, diagnostics), "inline.split.first", diagnostics);
        expect(!compile_and_load(sc, reg, second, diagnostics), "inline.split.user_code_hidden");
        expect(diagnostics.find("could not be evaluated at compile time") != std::string::npos, "inline.split.message", diagnostics);
    }
    {
        registry::ArtifactRegistry reg;
        reg.set_shared_compile_execute_mode(true);
        ScriptCompiler sc(reg);
        std::string diagnostics;
        expect(compile_and_load(sc, reg, first, diagnostics), "inline.shared.first", diagnostics);
        expect(compile_and_load(sc, reg, second, diagnostics), "inline.shared.second", diagnostics);
        auto cmd1 = sc.symbols().find_global("cmd1");
        const kiln::frontend::MemberSymbol* b = cmd1 ? cmd1->find("b") : nullptr;
        expect(b && b->constant == 10, "inline.shared.value");
    }
}

static void test_completion() {
    registry::ArtifactRegistry reg;
    ScriptCompiler sc(reg);
    std::string diagnostics;
    compile_and_load(sc, reg, "export module cmd0 { val alpha = 1\nval also = 2\ndef beta() = 3 }", diagnostics);

    std::string text = "cmd0.al";
    auto members = sc.complete(text.size(), "", text);
    expect(members.start == 5, "completion.start");
    expect(members.candidates == std::vector<std::string>{"alpha", "also"}, "completion.members");

    std::string bare = "be";
    auto imported = sc.complete(bare.size(), "import cmd0.beta\n", bare);
    expect(imported.candidates == std::vector<std::string>{"beta"}, "completion.preamble");

    auto keywords = sc.complete(3, "", "laz");
    expect(keywords.candidates == std::vector<std::string>{"lazy"}, "completion.keywords");

    auto globals = sc.complete(2, "", "cm");
    expect(globals.candidates == std::vector<std::string>{"cmd0"}, "completion.globals");
}

int main() {
    try {
        test_exports_and_artifacts();
        test_failed_units_commit_nothing();
        test_reset();
        test_extern_validation();
        test_inline_vals_follow_loader_mode();
        test_completion();
    } catch (const std::exception& e) {
        std::cerr << "FAIL(unexpected exception): " << e.what() << "\n";
        return 1;
    }

    if (failures) {
        std::cerr << failures << " script compiler test(s) failed\n";
        return 1;
    }
    std::cout << "script compiler tests passed\n";
    return 0;
}
