#include <csignal>
#include <iostream>
#include <string>

#include "backend/runtime/runtime_context.hpp"
#include "frontend/interactive/interrupt.hpp"

using namespace kiln::frontend::interactive;
namespace rt = kiln::backend::runtime;

static int failures = 0;
static volatile std::sig_atomic_t outer_hits = 0;

static void expect(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")\n";
        ++failures;
    }
}

extern "C" void outer_handler(int) {
    outer_hits = outer_hits + 1;
}

static void (*current_handler())(int) {
    struct sigaction action {};
    sigaction(SIGINT, nullptr, &action);
    return action.sa_handler;
}

int main() {
    struct sigaction outer {};
    outer.sa_handler = outer_handler;
    sigemptyset(&outer.sa_mask);
    sigaction(SIGINT, &outer, nullptr);

    rt::clear_interrupt();
    {
        InterruptScope scope;
        expect(scope.installed(), "installed");
        expect(current_handler() != outer_handler, "handler_replaced");

        std::raise(SIGINT);
        expect(rt::consume_interrupt(), "flag_set");
        expect(!rt::consume_interrupt(), "flag_consumed");
        expect(outer_hits == 0, "outer_not_called");

        void (*inner_handler)(int) = current_handler();
        {
            InterruptScope nested;
            std::raise(SIGINT);
            expect(rt::consume_interrupt(), "nested_flag_set");
        }
        expect(current_handler() == inner_handler, "nested_restored");
    }

    expect(current_handler() == outer_handler, "outer_restored");
    std::raise(SIGINT);
    expect(outer_hits == 1 && !rt::consume_interrupt(), "outer_active_again");

    rt::request_interrupt();
    rt::clear_interrupt();
    expect(!rt::consume_interrupt(), "clear");

    if (failures) {
        std::cerr << failures << " interrupt test(s) failed\n";
        return 1;
    }
    std::cout << "interrupt tests passed\n";
    return 0;
}
