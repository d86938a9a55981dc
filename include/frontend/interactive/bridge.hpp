#pragma once

#include <string>

namespace kiln::frontend::interactive {

// Fragment run before the first user line, as line -1.
struct BridgeConfig {
    std::string bootstrap;
    std::string line_id = "cmd-1";
};

BridgeConfig default_bridge();

} // namespace kiln::frontend::interactive
