#include "frontend/interactive/bridge.hpp"

namespace kiln::frontend::interactive {

BridgeConfig default_bridge() {
    BridgeConfig config;
    config.bootstrap =
        "extern def kiln_rt_exit(): Unit\n"
        "extern def kiln_rt_fail(message: Str): Unit\n"
        "extern def kiln_rt_println(text: Str): Unit\n"
        "extern def kiln_rt_int_to_str(value: Int): Str\n"
        "def exit(): Unit = kiln_rt_exit()\n"
        "def fail(message: Str): Unit = kiln_rt_fail(message)\n"
        "def println(text: Str): Unit = kiln_rt_println(text)\n"
        "implicit def intToStr(value: Int): Str = kiln_rt_int_to_str(value)\n";
    return config;
}

} // namespace kiln::frontend::interactive
