#include <iostream>
#include <string>

#include "frontend/interactive/import_ledger.hpp"

using namespace kiln::frontend::interactive;

static int failures = 0;

static void expect_eq(const std::string& actual, const std::string& expected, const std::string& name) {
    if (actual != expected) {
        std::cerr << "FAIL(" << name << "): expected [" << expected << "] got [" << actual << "]\n";
        ++failures;
    }
}

static void expect(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")\n";
        ++failures;
    }
}

static ImportEntry named(const std::string& prefix, const std::string& source, const std::string& local, bool implicit = false) {
    ImportEntry entry;
    entry.prefix = prefix;
    entry.source = source;
    entry.local = local;
    entry.implicit = implicit;
    return entry;
}

static void test_rendering() {
    expect_eq(named("cmd0", "x", "x").render(), "import cmd0.x", "render.plain");
    expect_eq(named("cmd0", "x", "y").render(), "import cmd0.{x => y}", "render.renamed");
    expect_eq(wildcard_import("cmd1.INSTANCE").render(), "import cmd1.INSTANCE._", "render.wildcard");
}

static void test_shadowing_replaces_in_place() {
    ImportLedger ledger;
    ledger.update({named("cmd0", "x", "x"), named("cmd0", "y", "y")});
    ledger.update({named("cmd2", "x", "x")});

    expect(ledger.entries().size() == 2, "shadowing.size");
    expect_eq(ledger.entries()[0].prefix, "cmd2", "shadowing.position");
    expect_eq(ledger.previous_import_block({"x", "y"}), "import cmd2.x\nimport cmd0.y\n", "shadowing.block");
}

static void test_filtering() {
    ImportLedger ledger;
    ledger.update({
        named("cmd_1", "println", "println"),
        named("cmd_1", "intToStr", "intToStr", true),
        wildcard_import("cmd0"),
        named("cmd1", "a", "a"),
    });

    expect_eq(ledger.previous_import_block({"a"}),
              "import cmd_1.intToStr\nimport cmd0._\nimport cmd1.a\n", "filtering.referenced");
    expect_eq(ledger.previous_import_block(std::set<std::string>{}),
              "import cmd_1.intToStr\nimport cmd0._\n", "filtering.nothing_referenced");
    expect_eq(ledger.previous_import_block(),
              "import cmd_1.println\nimport cmd_1.intToStr\nimport cmd0._\nimport cmd1.a\n", "filtering.everything");
}

static void test_wildcards_always_append() {
    ImportLedger ledger;
    ledger.update({wildcard_import("cmd0")});
    ledger.update({wildcard_import("cmd0")});
    expect(ledger.entries().size() == 2, "wildcards.append");

    // a named entry never replaces a wildcard
    ledger.update({named("cmd3", "_", "_")});
    expect(ledger.entries().size() == 3 && ledger.entries()[0].wildcard, "wildcards.not_replaced");

    ledger.clear();
    expect(ledger.entries().empty(), "clear");
}

int main() {
    test_rendering();
    test_shadowing_replaces_in_place();
    test_filtering();
    test_wildcards_always_append();

    if (failures) {
        std::cerr << failures << " import ledger test(s) failed\n";
        return 1;
    }
    std::cout << "import ledger tests passed\n";
    return 0;
}
