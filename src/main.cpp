#include <iostream>
#include <string>

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include "frontend/interactive/repl.hpp"

namespace cl = llvm::cl;
using kiln::frontend::interactive::Repl;
using kiln::frontend::interactive::ReplConfig;
using kiln::frontend::interactive::WrapMode;

static cl::OptionCategory kiln_category("kiln options");

static cl::opt<std::string> predef_code("predef", cl::desc("Code run before the first prompt"),
                                        cl::value_desc("code"), cl::cat(kiln_category));
static cl::opt<std::string> wrap_mode("wrap", cl::desc("Wrapping of fragments: object or class"),
                                      cl::init("object"), cl::cat(kiln_category));
static cl::opt<bool> shared_loader("shared-loader", cl::desc("Compile and execute through one loader"),
                                   cl::cat(kiln_category));
static cl::opt<std::string> history_file("hist-file", cl::desc("File fragments are appended to"),
                                         cl::value_desc("path"), cl::cat(kiln_category));
static cl::list<std::string> classpath("cp", cl::desc("Runtime classpath root"), cl::value_desc("path"),
                                       cl::cat(kiln_category));
static cl::list<std::string> plugin_paths("plugin", cl::desc("Compiler plugin root"), cl::value_desc("path"),
                                          cl::cat(kiln_category));
static cl::list<std::string> libraries("lib", cl::desc("Library to resolve, name[:version]"),
                                       cl::value_desc("coordinate"), cl::cat(kiln_category));
static cl::list<std::string> library_dirs("L", cl::desc("Directory searched for libraries"),
                                          cl::value_desc("dir"), cl::Prefix, cl::cat(kiln_category));
static cl::opt<bool> no_plugins("no-plugins", cl::desc("Hide plugin roots from the compiler"),
                                cl::cat(kiln_category));
static cl::opt<std::string> prompt("prompt", cl::desc("Prompt text"), cl::init("@ "), cl::cat(kiln_category));

int main(int argc, char* argv[]) {
    cl::HideUnrelatedOptions(kiln_category);
    cl::ParseCommandLineOptions(argc, argv, "kiln interactive shell\n");

    ReplConfig config;
    if (wrap_mode == "object") {
        config.wrap = WrapMode::Object;
    } else if (wrap_mode == "class") {
        config.wrap = WrapMode::Class;
    } else {
        llvm::WithColor::error() << "unknown wrap mode '" << wrap_mode << "', expected object or class\n";
        return 255;
    }

    config.prompt = prompt;
    config.shared_loader = shared_loader;
    config.history_file = history_file;
    config.predef = predef_code;
    config.classpath.assign(classpath.begin(), classpath.end());
    config.plugin_paths.assign(plugin_paths.begin(), plugin_paths.end());
    config.libraries.assign(libraries.begin(), libraries.end());
    config.library_dirs.assign(library_dirs.begin(), library_dirs.end());
    config.compiler_plugins = !no_plugins;

    Repl repl(config, std::cin, llvm::outs());
    return repl.run();
}
