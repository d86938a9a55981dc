#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "frontend/interactive/fault_classifier.hpp"
#include "frontend/interactive/result.hpp"

using namespace kiln::frontend::interactive;
namespace rt = kiln::backend::runtime;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ":\n" + detail) << "\n";
        ++failures;
    }
}

static void test_short_circuit() {
    Res<int> two = Res<int>::success(2);
    Res<std::string> text = two.map([](const int& v) { return std::to_string(v * 2); });
    expect(text.is_success() && text.value() == "4", "map.success");

    int calls = 0;
    Res<int> failed = Failure{"nope", std::nullopt};
    Res<int> mapped = failed.map([&](const int& v) { ++calls; return v; });
    expect(mapped.is_failure() && mapped.failure().message == "nope" && calls == 0, "map.failure");

    Res<int> exit = Exit{};
    Res<std::string> chained = exit.flat_map([&](const int&) { ++calls; return Res<std::string>::success("x"); });
    expect(chained.is_exit() && calls == 0, "flat_map.exit");

    Res<int> buffered = Buffer{"{"};
    expect(buffered.forward<std::string>().buffer().text == "{", "forward.buffer");
    expect(Res<int>(Skip{}).forward<bool>().is_skip(), "forward.skip");
}

static void test_match() {
    auto describe = [](const Res<int>& r) {
        return r.match(
            [](const int& v) { return "success " + std::to_string(v); },
            [](const Failure& f) { return "failure " + f.message; },
            [] { return std::string("exit"); },
            [] { return std::string("skip"); },
            [](const Buffer& b) { return "buffer " + b.text; });
    };
    expect(describe(Res<int>::success(1)) == "success 1", "match.success");
    expect(describe(Failure{"x", std::nullopt}) == "failure x", "match.failure");
    expect(describe(Exit{}) == "exit", "match.exit");
    expect(describe(Skip{}) == "skip", "match.skip");
    expect(describe(Buffer{"("}) == "buffer (", "match.buffer");
}

static void test_from_optional() {
    expect(Res<int>::from_optional(5, "missing").value() == 5, "from_optional.value");
    expect(Res<int>::from_optional(std::nullopt, "missing").failure().message == "missing", "from_optional.empty");
}

static void test_fault_rendering() {
    auto inner = rt::make_fault(rt::fault_types::kArithmeticError, "division by zero",
                                {"cmd2.f", "cmd2$Main.$main", rt::kHostFrame});
    auto invocation = rt::make_fault(rt::fault_types::kInvocationError, "", {}, inner);

    Res<std::string> res = classify_fault(invocation);
    expect(res.is_failure(), "fault.failure");
    std::string expected = "kiln.ArithmeticError: division by zero\n  at cmd2.f\n  at cmd2$Main.$main";
    expect(res.failure().message == expected, "fault.cut_at_host", res.failure().message);
    expect(res.failure().stop_marker == std::optional<std::string>("evaluator_run_printer"), "fault.stop_marker");
}

static void test_initializer_faults() {
    auto inner = rt::make_fault(rt::fault_types::kRuntimeError, "bad",
                                {"cmd_1.fail", "cmd5.$init", "cmd5$Main.$main", rt::kHostFrame});
    auto init = rt::make_fault(rt::fault_types::kInitializerError, "", {"cmd5$Main.$main", rt::kHostFrame}, inner);
    auto invocation = rt::make_fault(rt::fault_types::kInvocationError, "", {}, init);

    Res<std::string> res = classify_fault(invocation);
    std::string expected = "kiln.RuntimeError: bad\n  at cmd_1.fail\n  at cmd5.$init";
    expect(res.is_failure() && res.failure().message == expected, "initializer.cut_at_main", res.failure().message);
}

static void test_exit_and_interrupt() {
    auto exit = rt::make_fault(rt::fault_types::kExit, "exit requested", {"cmd_1.exit"});
    expect(classify_fault(rt::make_fault(rt::fault_types::kInvocationError, "", {}, exit)).is_exit(), "exit.direct");

    auto nested = rt::make_fault(rt::fault_types::kInvocationError, "", {},
                                 rt::make_fault(rt::fault_types::kInitializerError, "", {}, exit));
    expect(classify_fault(nested).is_exit(), "exit.under_initializer");

    auto interrupted = rt::make_fault(rt::fault_types::kInterrupted, "interrupted", {"cmd1.loop"});
    Res<std::string> res = classify_fault(rt::make_fault(rt::fault_types::kInvocationError, "", {}, interrupted));
    expect(res.is_failure() && res.failure().message == "Interrupted!", "interrupt");
}

static void test_causes() {
    auto cause = rt::make_fault(rt::fault_types::kRuntimeError, "root", {"a.b"});
    auto outer = rt::make_fault(rt::fault_types::kRuntimeError, "", {"c.d", "e.stop"}, cause);
    Failure failure = Failure::from_fault(outer, "stop");
    expect(failure.message == "kiln.RuntimeError\n  at c.d\nCaused by: kiln.RuntimeError: root\n  at a.b",
           "causes", failure.message);

    Failure unexpected = unexpected_failure(std::runtime_error("disk on fire"));
    expect(unexpected.message == "disk on fire\nSomething unexpected went wrong =(", "unexpected");
}

static void test_long_traces_collapse() {
    std::vector<std::string> frames(kMaxTraceFrames + 5, "cmd0.f");
    frames.push_back("cmd0$Main.$main");
    frames.push_back("host.after");
    auto overflow = rt::make_fault(rt::fault_types::kStackOverflowError, "call depth exceeded", frames);

    Failure failure = Failure::from_fault(overflow, "$main");
    std::size_t rendered = 0;
    for (std::size_t at = failure.message.find("\n  at "); at != std::string::npos;
         at = failure.message.find("\n  at ", at + 1)) {
        ++rendered;
    }
    expect(rendered == kMaxTraceFrames, "long_trace.capped", std::to_string(rendered));
    const std::string remainder = "\n  ... 5 more";
    expect(failure.message.size() > remainder.size() &&
               failure.message.compare(failure.message.size() - remainder.size(), remainder.size(), remainder) == 0,
           "long_trace.remainder");
    expect(failure.message.find("host.after") == std::string::npos, "long_trace.stop_marker_first");

    Failure short_trace = Failure::from_fault(rt::make_fault(rt::fault_types::kRuntimeError, "x", {"a.b"}), "$main");
    expect(short_trace.message.find("more") == std::string::npos, "long_trace.short_untouched");
}

int main() {
    test_short_circuit();
    test_match();
    test_from_optional();
    test_fault_rendering();
    test_initializer_faults();
    test_exit_and_interrupt();
    test_causes();
    test_long_traces_collapse();

    if (failures) {
        std::cerr << failures << " result test(s) failed\n";
        return 1;
    }
    std::cout << "result tests passed\n";
    return 0;
}
