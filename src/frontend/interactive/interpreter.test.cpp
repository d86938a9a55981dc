#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "backend/runtime/runtime_context.hpp"
#include "frontend/interactive/interpreter.hpp"

using namespace kiln::frontend::interactive;
using kiln::backend::registry::ClassLoaderTier;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ":\n" + detail) << "\n";
        ++failures;
    }
}

static const std::string kFixtures = std::string(KILN_SOURCE_DIR) + "/tests/fixtures";

static std::string describe(const Res<std::string>& res) {
    return res.match(
        [](const std::string& v) { return "success: " + v; },
        [](const Failure& f) { return "failure: " + f.message; },
        [] { return std::string("exit"); },
        [] { return std::string("skip"); },
        [](const Buffer& b) { return "buffer: " + b.text; });
}

static void expect_value(Interpreter& interp, const std::string& input, const std::string& expected, const std::string& name) {
    Res<std::string> res = interp.process(input);
    expect(res.is_success() && res.value() == expected, name, describe(res));
}

static InterpreterConfig quiet_config(std::string* output = nullptr) {
    InterpreterConfig config;
    config.printer = [output](const std::string& text) {
        if (output) *output += text;
    };
    return config;
}

static bool started(Interpreter& interp, const std::string& name) {
    Res<bool> res = interp.start();
    expect(res.is_success(), name + ".start", res.is_failure() ? res.failure().message : "");
    return res.is_success();
}

static void test_values_and_lines() {
    Interpreter interp(quiet_config());
    if (!started(interp, "values")) return;
    expect(interp.line() == 0, "values.bridge_does_not_advance");

    expect_value(interp, "val x = 1", "x = 1", "values.define");
    expect_value(interp, "x + 1", "res1 = 2", "values.use");
    expect(interp.line() == 2, "values.line");
    expect(interp.sources().count("cmd0") && interp.sources().count("cmd1"), "values.sources");
    expect(interp.history() == std::vector<std::string>{"val x = 1", "x + 1"}, "values.history");

    expect_value(interp, "val x = \"s\"", "x = \"s\"", "values.shadow_define");
    expect_value(interp, "x ++ \"!\"", "res3 = \"s!\"", "values.shadowed");

    expect_value(interp, "def twice(n: Int): Int = n * 2", "defined function twice", "values.def");
    expect_value(interp, "twice(21)", "res5 = 42", "values.call");
}

static void test_failures_and_lines() {
    Interpreter interp(quiet_config());
    if (!started(interp, "failures")) return;

    Res<std::string> compile = interp.process("val = 3");
    expect(compile.is_failure() && compile.failure().message.rfind("Compilation Failed\n", 0) == 0,
           "failures.compile", describe(compile));
    expect(interp.line() == 1, "failures.compile_advances");

    Res<std::string> unbalanced = interp.process("1)");
    expect(unbalanced.is_failure(), "failures.parse_error");
    expect(interp.line() == 1, "failures.parse_error_does_not_advance");

    Res<std::string> runtime = interp.process("1 / 0");
    expect(runtime.is_failure() && runtime.failure().message.rfind("kiln.ArithmeticError: / by zero", 0) == 0,
           "failures.runtime", describe(runtime));
    expect(runtime.failure().message.find("evaluator_run_printer") == std::string::npos, "failures.host_frames_cut");
    expect(interp.line() == 2, "failures.runtime_advances");

    Res<std::string> user = interp.process("fail(\"boom\")");
    expect(user.is_failure() && user.failure().message.rfind("kiln.RuntimeError: boom", 0) == 0, "failures.user", describe(user));

    // the session keeps going after failures
    expect_value(interp, "7", "res3 = 7", "failures.recovered");
}

static void test_overflowing_division() {
    Interpreter interp(quiet_config());
    if (!started(interp, "overflow")) return;

    const std::string min = "(0 - 9223372036854775807 - 1)";
    expect_value(interp, min + " / (0 - 1)", "res0 = -9223372036854775808", "overflow.div_wraps");
    expect_value(interp, min + " % (0 - 1)", "res1 = 0", "overflow.mod");
    expect_value(interp, "7 % (0 - 1)", "res2 = 0", "overflow.mod_minus_one");
    expect_value(interp, "1 + 1", "res3 = 2", "overflow.session_alive");
}

static void test_interrupting_running_code() {
    Interpreter interp(quiet_config());
    if (!started(interp, "interrupt")) return;

    expect_value(interp, "def fib(n: Int): Int = if (n < 2) n else fib(n - 1) + fib(n - 2)",
                 "defined function fib", "interrupt.define");

    // keeps asking until the evaluation returns, so a request landing
    // before the invocation clears its flag is not lost
    std::atomic<bool> done{false};
    std::thread interrupter([&done] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        while (!done.load()) {
            kiln::backend::runtime::request_interrupt();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
    Res<std::string> res = interp.process("fib(60)");
    done.store(true);
    interrupter.join();

    expect(res.is_failure() && res.failure().message == "Interrupted!", "interrupt.failure", describe(res));
    expect(interp.line() == 2, "interrupt.advances");
    expect_value(interp, "1 + 1", "res2 = 2", "interrupt.session_continues");
}

static void test_buffering() {
    Interpreter interp(quiet_config());
    if (!started(interp, "buffering")) return;

    Res<std::string> open = interp.process("{");
    expect(open.is_buffer() && open.buffer().text == "{", "buffering.buffer", describe(open));
    expect(interp.buffering() && interp.line() == 0, "buffering.pending");

    expect_value(interp, "}", "res0 = ()", "buffering.joined");
    expect(!interp.buffering() && interp.line() == 1, "buffering.done");
    expect(interp.history().back() == "{}", "buffering.history_holds_joined_text");

    expect(interp.process("").is_skip() && interp.line() == 1, "buffering.blank_skips");
}

static void test_exit() {
    Interpreter interp(quiet_config());
    if (!started(interp, "exit")) return;
    expect(interp.process("exit()").is_exit(), "exit.direct");
    expect(interp.process("val y = exit()").is_exit(), "exit.under_initializer");
    expect(interp.process("def later(): Unit = exit()\nlater()").is_exit(), "exit.nested_call");
}

static void test_output_and_implicits() {
    std::string output;
    Interpreter interp(quiet_config(&output));
    if (!started(interp, "output")) return;

    expect_value(interp, "println(\"hello\")", "res0 = ()", "output.println_value");
    expect(output == "hello\n", "output.printer", output);

    // intToStr is implicit, so it is imported even when not mentioned
    expect_value(interp, "\"n=\" ++ 5", "res1 = \"n=5\"", "output.implicit_conversion");
}

static void test_class_wrapping() {
    InterpreterConfig config = quiet_config();
    config.wrap = WrapMode::Class;
    Interpreter interp(std::move(config));
    if (!started(interp, "class_wrap")) return;

    expect_value(interp, "val a = 2", "a = 2", "class_wrap.define");
    expect_value(interp, "a * 3", "res1 = 6", "class_wrap.use");

    expect_value(interp, "import special.wrap.obj\nval b = 4", "b = 4", "class_wrap.escape");
    expect(interp.sources().count("specialObjCmd2") == 1, "class_wrap.escape_wrapper");
    expect_value(interp, "a + b", "res3 = 6", "class_wrap.mixed");
}

static std::size_t wildcard_count(const Interpreter& interp) {
    const auto& entries = interp.ledger().entries();
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [](const ImportEntry& e) { return e.wildcard; }));
}

static void test_class_wrapping_keeps_ledger_small() {
    InterpreterConfig config = quiet_config();
    config.wrap = WrapMode::Class;
    Interpreter interp(std::move(config));
    if (!started(interp, "class_ledger")) return;

    Res<std::string> setup = interp.process("class B {\nval one = 1\n}\nval b = new B\nimport b._");
    expect(setup.is_success(), "class_ledger.setup", describe(setup));
    expect(wildcard_count(interp) == 1, "class_ledger.one_wildcard");
    std::size_t size = interp.ledger().entries().size();

    for (int k = 1; k <= 6; ++k) {
        expect_value(interp, "val v" + std::to_string(k) + " = one + " + std::to_string(k),
                     "v" + std::to_string(k) + " = " + std::to_string(1 + k), "class_ledger.use");
    }
    expect(wildcard_count(interp) == 1, "class_ledger.still_one_wildcard", std::to_string(wildcard_count(interp)));
    // one new name per fragment, nothing re-exported from the preamble
    expect(interp.ledger().entries().size() == size + 6, "class_ledger.linear_growth",
           std::to_string(interp.ledger().entries().size()));
}

static void test_shared_mode() {
    Interpreter interp(quiet_config());
    if (!started(interp, "shared")) return;

    expect_value(interp, "val a = 5", "a = 5", "shared.define");
    Res<std::string> split = interp.process("inline val b = a * 2");
    expect(split.is_failure() && split.failure().message.find("could not be evaluated at compile time") != std::string::npos,
           "shared.split_loaders_hide_user_code", describe(split));

    Res<bool> swapped = interp.set_shared_compile_execute_mode(true);
    expect(swapped.is_success() && swapped.value(), "shared.swapped");
    expect(interp.sources().size() == 1 && interp.sources().count("cmd_1") == 1, "shared.session_rebuilt");

    expect_value(interp, "val a = 5", "a = 5", "shared.redefine");
    expect_value(interp, "inline val b = a * 2", "b = 10", "shared.inline");

    Res<bool> again = interp.set_shared_compile_execute_mode(true);
    expect(again.is_success() && !again.value(), "shared.no_change");
}

static void test_libraries() {
    InterpreterConfig config = quiet_config();
    config.library_dirs = {kFixtures + "/libs"};
    Interpreter interp(std::move(config));
    if (!started(interp, "libraries")) return;

    Res<std::vector<std::string>> missing = interp.add_libraries({"nothing"}, ClassLoaderTier::Runtime);
    expect(missing.is_failure() && missing.failure().message == "unresolved dependencies: nothing", "libraries.missing");

    Res<std::vector<std::string>> added = interp.add_libraries({"mathlib"}, ClassLoaderTier::Runtime);
    expect(added.is_success() && added.value().size() == 1, "libraries.added");

    expect_value(interp, "extern def mathlib_triple(x: Int): Int", "defined function mathlib_triple", "libraries.extern");
    expect_value(interp, "mathlib_triple(4)", "res1 = 12", "libraries.call");
}

static void test_helpers() {
    Interpreter interp(quiet_config());
    if (!started(interp, "helpers")) return;

    Res<std::vector<Decl>> decls = interp.decls("val a = 1; a + 1");
    expect(decls.is_success() && decls.value().size() == 2, "helpers.decls");
    expect(interp.decls("(").is_failure(), "helpers.decls_incomplete");
    expect(interp.line() == 0, "helpers.decls_do_not_advance");

    expect_value(interp, "val alpha = 1", "alpha = 1", "helpers.define");
    auto completion = interp.complete(2, "al");
    bool found = std::find(completion.candidates.begin(), completion.candidates.end(), "alpha") != completion.candidates.end();
    expect(found && completion.start == 0, "helpers.complete");

    expect(interp.process("val boom = 1 / 0").is_failure(), "helpers.failed_fragment");
    auto wrappers = interp.complete(3, "cmd").candidates;
    auto listed = [&](const std::string& name) {
        return std::find(wrappers.begin(), wrappers.end(), name) != wrappers.end();
    };
    expect(listed("cmd0") && !listed("cmd1"), "helpers.complete_hides_failed_wrappers");

    int stops = 0;
    interp.on_stop([&] { ++stops; });
    interp.stop();
    interp.stop();
    expect(stops == 1, "helpers.stop_hooks_run_once");
}

static void test_predef() {
    InterpreterConfig config = quiet_config();
    config.predef = "val seed = 40";
    Interpreter interp(std::move(config));
    if (!started(interp, "predef")) return;
    expect(interp.sources().count("predef") == 1, "predef.wrapper_name");
    expect_value(interp, "seed + 2", "res0 = 42", "predef.visible");
}

int main() {
    try {
        test_values_and_lines();
        test_failures_and_lines();
        test_overflowing_division();
        test_interrupting_running_code();
        test_buffering();
        test_exit();
        test_output_and_implicits();
        test_class_wrapping();
        test_class_wrapping_keeps_ledger_small();
        test_shared_mode();
        test_libraries();
        test_helpers();
        test_predef();
    } catch (const std::exception& e) {
        std::cerr << "FAIL(unexpected exception): " << e.what() << "\n";
        return 1;
    }

    if (failures) {
        std::cerr << failures << " interpreter test(s) failed\n";
        return 1;
    }
    std::cout << "interpreter tests passed\n";
    return 0;
}
