#pragma once

#include <istream>
#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "frontend/interactive/interpreter.hpp"

namespace kiln::frontend::interactive {

struct ReplConfig {
    std::string prompt = "@ ";
    WrapMode wrap = WrapMode::Object;
    bool shared_loader = false;
    std::string history_file;
    std::string predef;
    std::vector<std::string> classpath;
    std::vector<std::string> plugin_paths;
    // `name[:version]` coordinates resolved against library_dirs
    std::vector<std::string> libraries;
    std::vector<std::string> library_dirs;
    bool compiler_plugins = true;
};

/**
 * Repl
 *
 * Reads fragments line by line and prints what the interpreter makes of
 * them. Lines starting with ':' outside a pending fragment are meta
 * commands:
 *
 *   :load <coordinate>...   resolve libraries onto the runtime classpath
 *   :shared on|off          toggle the shared compile/execute loader
 *   :sources [wrapper]      list wrappers, or print one wrapper's source
 */
class Repl {
public:
    Repl(ReplConfig config, std::istream& in, llvm::raw_ostream& out);

    // Returns the process exit status.
    int run();

    Interpreter& interpreter() { return interpreter_; }

private:
    bool setup();
    // Returns false when the session should end.
    bool handle(const Res<std::string>& result);
    void meta_command(const std::string& line);
    void print_failure(const std::string& message);

    ReplConfig config_;
    std::istream& in_;
    llvm::raw_ostream& out_;
    Interpreter interpreter_;
};

} // namespace kiln::frontend::interactive
