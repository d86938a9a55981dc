#pragma once

#include <csignal>

namespace kiln::frontend::interactive {

/**
 * InterruptScope
 *
 * Routes SIGINT to the runtime's interrupt flag for its lifetime. The
 * handler in place before construction is restored on destruction, so
 * scopes nest.
 */
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    bool installed() const { return installed_; }

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

} // namespace kiln::frontend::interactive
