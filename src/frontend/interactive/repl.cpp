#include "frontend/interactive/repl.hpp"

#include <sstream>

#include <llvm/Support/WithColor.h>

#include "frontend/interactive/interrupt.hpp"

namespace kiln::frontend::interactive {

using backend::registry::ClassLoaderTier;

namespace {

InterpreterConfig interpreter_config(const ReplConfig& config, llvm::raw_ostream& out) {
    InterpreterConfig result;
    result.wrap = config.wrap;
    result.shared_loader = config.shared_loader;
    result.plugins_enabled = config.compiler_plugins;
    result.predef = config.predef;
    result.history_file = config.history_file;
    result.library_dirs = config.library_dirs;
    result.printer = [&out](const std::string& text) {
        out << text;
        out.flush();
    };
    return result;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

Repl::Repl(ReplConfig config, std::istream& in, llvm::raw_ostream& out)
    : config_(std::move(config)), in_(in), out_(out), interpreter_(interpreter_config(config_, out)) {}

void Repl::print_failure(const std::string& message) {
    llvm::WithColor(out_, llvm::raw_ostream::RED) << message << "\n";
}

bool Repl::setup() {
    auto& registry = interpreter_.registry();
    auto report_rejected = [&](const std::vector<std::string>& requested, const std::vector<std::string>& accepted) {
        if (requested.size() != accepted.size()) {
            llvm::WithColor::warning() << (requested.size() - accepted.size()) << " classpath entries do not exist\n";
        }
    };

    if (!config_.classpath.empty()) {
        report_rejected(config_.classpath, registry.add_paths(ClassLoaderTier::Runtime, config_.classpath));
    }
    if (!config_.plugin_paths.empty()) {
        report_rejected(config_.plugin_paths, registry.add_paths(ClassLoaderTier::Plugin, config_.plugin_paths));
    }
    if (!config_.libraries.empty()) {
        Res<std::vector<std::string>> added = interpreter_.add_libraries(config_.libraries, ClassLoaderTier::Runtime);
        if (added.is_failure()) {
            print_failure(added.failure().message);
            return false;
        }
    }

    Res<bool> started = interpreter_.start();
    if (started.is_failure()) {
        print_failure(started.failure().message);
        return false;
    }
    return !started.is_exit();
}

void Repl::meta_command(const std::string& line) {
    std::vector<std::string> words = split_words(line.substr(1));
    if (words.empty()) {
        print_failure("empty command");
        return;
    }

    const std::string& command = words.front();
    std::vector<std::string> args(words.begin() + 1, words.end());

    if (command == "load") {
        if (args.empty()) {
            print_failure(":load needs at least one coordinate");
            return;
        }
        Res<std::vector<std::string>> added = interpreter_.add_libraries(args, ClassLoaderTier::Runtime);
        if (added.is_failure()) {
            print_failure(added.failure().message);
            return;
        }
        for (const auto& path : added.value()) {
            out_ << "added " << path << "\n";
        }
    } else if (command == "shared") {
        if (args.size() != 1 || (args[0] != "on" && args[0] != "off")) {
            print_failure("usage: :shared on|off");
            return;
        }
        Res<bool> swapped = interpreter_.set_shared_compile_execute_mode(args[0] == "on");
        if (swapped.is_failure()) {
            print_failure(swapped.failure().message);
            return;
        }
        out_ << "shared compile/execute mode " << args[0];
        if (swapped.is_success() && swapped.value()) {
            out_ << " (session reset)";
        }
        out_ << "\n";
    } else if (command == "sources") {
        const auto& sources = interpreter_.sources();
        if (args.empty()) {
            for (const auto& entry : sources) {
                out_ << entry.first << "\n";
            }
            return;
        }
        auto found = sources.find(Wrapper::sanitize(args[0]));
        if (found == sources.end()) {
            print_failure("no sources for " + args[0]);
            return;
        }
        out_ << found->second;
    } else {
        print_failure("unknown command :" + command);
    }
}

bool Repl::handle(const Res<std::string>& result) {
    return result.match(
        [&](const std::string& value) {
            if (!value.empty()) out_ << value << "\n";
            return true;
        },
        [&](const Failure& failure) {
            print_failure(failure.message);
            return true;
        },
        [&]() {
            out_ << "Bye!\n";
            return false;
        },
        [&]() { return true; },
        [&](const Buffer&) { return true; });
}

int Repl::run() {
    if (!setup()) {
        interpreter_.stop();
        return 1;
    }

    std::string continuation(config_.prompt.size(), ' ');
    std::string line;
    while (true) {
        out_ << (interpreter_.buffering() ? continuation : config_.prompt);
        out_.flush();
        if (!std::getline(in_, line)) {
            out_ << "\nBye!\n";
            break;
        }

        if (!interpreter_.buffering() && !line.empty() && line[0] == ':') {
            meta_command(line);
            continue;
        }

        std::string text = interpreter_.buffering() ? "\n" + line : line;
        Res<std::string> result = [&] {
            InterruptScope interrupts;
            return interpreter_.process(text);
        }();
        if (!handle(result)) {
            break;
        }
    }

    interpreter_.stop();
    return 0;
}

} // namespace kiln::frontend::interactive
