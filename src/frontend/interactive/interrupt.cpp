#include "frontend/interactive/interrupt.hpp"

#include "backend/runtime/runtime_context.hpp"

namespace kiln::frontend::interactive {

namespace {

extern "C" void on_sigint(int) {
    backend::runtime::request_interrupt();
}

} // namespace

InterruptScope::InterruptScope() {
    struct sigaction action {};
    action.sa_handler = on_sigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    installed_ = sigaction(SIGINT, &action, &previous_) == 0;
}

InterruptScope::~InterruptScope() {
    if (installed_) {
        sigaction(SIGINT, &previous_, nullptr);
    }
}

} // namespace kiln::frontend::interactive
