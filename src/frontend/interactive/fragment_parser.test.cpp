#include <iostream>
#include <string>

#include "frontend/interactive/fragment_parser.hpp"

using namespace kiln::frontend::interactive;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ": " + detail) << "\n";
        ++failures;
    }
}

static ParseOutcome parse(const std::string& source, const std::string& line = "0") {
    return FragmentParser().parse(source, line);
}

static void test_bare_expressions() {
    ParseOutcome single = parse("x + 1", "4");
    expect(single.kind == ParseOutcome::Kind::Declarations && single.decls.size() == 1, "bare.single");
    expect(single.decls[0].code == "val res4 = x + 1", "bare.single_code", single.decls[0].code);
    expect(single.decls[0].display == std::vector<DisplayItem>{DisplayItem::identity("res4")}, "bare.single_display");

    ParseOutcome several = parse("1; val a = 2; a * 3", "-1");
    expect(several.decls.size() == 3, "bare.several");
    expect(several.decls[0].code == "val res_1_0 = 1", "bare.first_index", several.decls[0].code);
    expect(several.decls[2].code == "val res_1_1 = a * 3", "bare.second_index", several.decls[2].code);
}

static void test_classification() {
    ParseOutcome out = parse(
        "lazy val l = 1\n"
        "inline val i = 2\n"
        "implicit def conv(v: Int): Str = \"\"\n"
        "extern def puts(s: Str): Int\n"
        "class Point(x: Int) { }\n"
        "module Util { }\n"
        "import cmd0.{a => b, c}");
    expect(out.decls.size() == 7, "classify.count", std::to_string(out.decls.size()));
    if (out.decls.size() != 7) return;

    expect(out.decls[0].display[0] == DisplayItem::lazy_identity("l"), "classify.lazy");
    expect(out.decls[1].display[0] == DisplayItem::identity("i"), "classify.inline");
    expect(out.decls[2].display[0] == DisplayItem::definition("function", "conv"), "classify.def");
    expect(out.decls[3].display[0] == DisplayItem::definition("function", "puts"), "classify.extern");
    expect(out.decls[4].display[0] == DisplayItem::definition("class", "Point"), "classify.class");
    expect(out.decls[5].display[0] == DisplayItem::definition("module", "Util"), "classify.module");
    expect(out.decls[6].display[0] == DisplayItem::import("cmd0.{a => b, c}"), "classify.import", out.decls[6].display[0].name);
}

static void test_referenced_names() {
    ParseOutcome out = parse("val y = x.member + f(z)");
    const auto& names = out.decls[0].referenced_names;
    expect(names.count("x") && names.count("f") && names.count("z") && names.count("y"), "referenced.present");
    expect(!names.count("member"), "referenced.selected_member_skipped");
}

static void test_incomplete_and_blank() {
    expect(parse("{").kind == ParseOutcome::Kind::Incomplete, "incomplete.brace");
    expect(parse("val x = 1 +").kind == ParseOutcome::Kind::Incomplete, "incomplete.operator");
    expect(parse("f(1,\n").kind == ParseOutcome::Kind::Incomplete, "incomplete.comma");
    ParseOutcome buffered = parse("def f() = {\n  1");
    expect(buffered.text == "def f() = {\n  1", "incomplete.text");

    ParseOutcome joined = parse(std::string("{") + "}");
    expect(joined.kind == ParseOutcome::Kind::Declarations && joined.decls[0].code == "val res0 = {}", "buffer_round_trip");

    expect(parse("").kind == ParseOutcome::Kind::Blank, "blank.empty");
    expect(parse("  // only a comment\n;").kind == ParseOutcome::Kind::Blank, "blank.comment");
}

static void test_statement_splitting() {
    ParseOutcome out = parse(
        "val a = if (true) 1\n"
        "  else 2\n"
        "val b = a\n"
        "  .toString\n"
        "val c = {\n  1\n  2\n}");
    expect(out.decls.size() == 3, "split.count", std::to_string(out.decls.size()));
}

static void test_parse_errors() {
    ParseOutcome unbalanced = parse("val x = 1)");
    expect(unbalanced.kind == ParseOutcome::Kind::ParseError && unbalanced.text == "1:10: unexpected ')'",
           "error.unbalanced", unbalanced.text);

    ParseOutcome mismatched = parse("(}");
    expect(mismatched.kind == ParseOutcome::Kind::ParseError, "error.mismatched");

    ParseOutcome string = parse("\"unterminated");
    expect(string.kind == ParseOutcome::Kind::ParseError && string.text == "1:1: unclosed string literal",
           "error.string", string.text);
}

int main() {
    test_bare_expressions();
    test_classification();
    test_referenced_names();
    test_incomplete_and_blank();
    test_statement_splitting();
    test_parse_errors();

    if (failures) {
        std::cerr << failures << " fragment parser test(s) failed\n";
        return 1;
    }
    std::cout << "fragment parser tests passed\n";
    return 0;
}
