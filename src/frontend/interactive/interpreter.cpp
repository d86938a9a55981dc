#include "frontend/interactive/interpreter.hpp"

#include <algorithm>

#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include "backend/compiler/script_compiler.hpp"
#include "frontend/interactive/fault_classifier.hpp"

namespace kiln::frontend::interactive {

namespace rt = backend::runtime;
using backend::registry::ClassLoaderTier;

namespace {

// "cmd-1" -> "-1", "cmd12" -> "12", anything else unchanged
std::string line_id_for(const std::string& wrapper_name) {
    if (wrapper_name.compare(0, 3, "cmd") == 0 && wrapper_name.size() > 3) {
        return wrapper_name.substr(3);
    }
    return wrapper_name;
}

Failure load_failure(const std::string& reason) {
    return Failure{"Failed to load compiled class " + reason, std::nullopt};
}

} // namespace

Interpreter::Interpreter(InterpreterConfig config)
    : config_(std::move(config)),
      wrapper_(config_.wrap),
      resolver_(std::make_unique<backend::resolver::FilesystemResolver>(config_.library_dirs)) {
    if (!config_.printer) {
        config_.printer = [](const std::string& text) { llvm::outs() << text; llvm::outs().flush(); };
    }
    session_.runtime.set_output(config_.printer);
    session_.compiler = std::make_unique<backend::compiler::ScriptCompiler>(session_.registry);
    session_.registry.set_shared_compile_execute_mode(config_.shared_loader);
    session_.registry.set_plugins_enabled(config_.plugins_enabled);

    if (!config_.history_file.empty()) {
        history_file_.emplace(config_.history_file);
        session_.history = history_file_->load();
    }
}

Res<bool> Interpreter::start() {
    Res<bool> bridge = run(config_.bridge.bootstrap, config_.bridge.line_id);
    if (!bridge.is_success() || config_.predef.empty()) {
        return bridge;
    }
    return run(config_.predef, "predef");
}

void Interpreter::advance(const std::string& text) {
    ++session_.line;
    session_.history.push_back(text);
    if (history_file_) {
        if (llvm::Error err = history_file_->append(text)) {
            llvm::WithColor::warning() << llvm::toString(std::move(err)) << "\n";
        }
    }
}

Res<std::string> Interpreter::process(const std::string& text) {
    try {
        std::string source = buffer_ ? *buffer_ + text : text;
        buffer_.reset();

        ParseOutcome parsed = parser_.parse(source, std::to_string(session_.line));
        switch (parsed.kind) {
            case ParseOutcome::Kind::Incomplete:
                buffer_ = parsed.text;
                return Buffer{parsed.text};
            case ParseOutcome::Kind::Blank:
                return Skip{};
            case ParseOutcome::Kind::ParseError:
                return Failure{parsed.text, std::nullopt};
            case ParseOutcome::Kind::Declarations:
                break;
        }

        std::string wrapper_name = "cmd" + std::to_string(session_.line);
        advance(source);
        return evaluate(parsed.decls, wrapper_name).map([](const Evaluated<std::string>& e) { return e.value; });
    } catch (const std::exception& e) {
        return unexpected_failure(e);
    }
}

Res<Evaluated<std::string>> Interpreter::evaluate(const std::vector<Decl>& decls, const std::string& candidate_name) {
    std::set<std::string> referenced;
    for (const auto& decl : decls) {
        referenced.insert(decl.referenced_names.begin(), decl.referenced_names.end());
    }
    WrappedUnit unit = wrapper_.wrap(decls, session_.ledger.previous_import_block(referenced), candidate_name);

    backend::compiler::CollectingSink sink;
    std::optional<backend::compiler::CompileOutput> compiled = session_.compiler->compile(unit.source, sink);
    if (!compiled) {
        return Failure{"Compilation Failed\n" + sink.render(), std::nullopt};
    }

    session_.unfinished.insert(unit.wrapper_name);
    for (auto& artifact : compiled->artifacts) {
        if (llvm::Error err = session_.registry.add_artifact(artifact.name, std::move(artifact.bytes), std::move(artifact.source))) {
            return load_failure(artifact.name + ": " + llvm::toString(std::move(err)));
        }
    }

    auto loader = session_.registry.current_loader(ClassLoaderTier::Runtime);
    if (!loader) {
        return load_failure(unit.wrapper_name + "$Main: " + llvm::toString(loader.takeError()));
    }
    auto entry = (*loader)->resolve(unit.wrapper_name + "$Main");
    if (!entry) {
        return load_failure(llvm::toString(entry.takeError()));
    }

    rt::clear_interrupt();
    backend::registry::InvokeOutcome outcome;
    {
        rt::RuntimeScope scope(session_.runtime);
        outcome = (*entry)->invoke_entry();
    }
    if (outcome.fault) {
        return classify_fault(outcome.fault).forward<Evaluated<std::string>>();
    }

    std::vector<ImportEntry> imports = compiled->exported;
    // already in the ledger; exporting them again would duplicate wildcards
    std::size_t carried = std::min(unit.carried_imports, imports.size());
    imports.erase(imports.begin(), imports.begin() + static_cast<std::ptrdiff_t>(carried));
    for (auto& entry_import : imports) {
        if (entry_import.prefix.empty()) {
            entry_import.prefix = unit.user_prefix;
        } else if (entry_import.relative) {
            entry_import.prefix = unit.user_prefix + "." + entry_import.prefix;
        }
        entry_import.relative = false;
    }
    session_.ledger.update(imports);
    session_.sources[unit.wrapper_name] = unit.source;
    session_.unfinished.erase(unit.wrapper_name);

    return Res<Evaluated<std::string>>::success({unit.wrapper_name, std::move(imports), std::move(outcome.value)});
}

Res<bool> Interpreter::run(const std::string& code, const std::string& wrapper_name) {
    auto discard = [](const std::string&) {};
    try {
        ParseOutcome parsed = parser_.parse(code, line_id_for(wrapper_name));
        switch (parsed.kind) {
            case ParseOutcome::Kind::Blank:
                return Res<bool>::success(true);
            case ParseOutcome::Kind::Incomplete:
                return Failure{"incomplete input in " + wrapper_name, std::nullopt};
            case ParseOutcome::Kind::ParseError:
                return Failure{wrapper_name + ": " + parsed.text, std::nullopt};
            case ParseOutcome::Kind::Declarations:
                break;
        }

        session_.runtime.set_output(discard);
        Res<Evaluated<std::string>> result = evaluate(parsed.decls, wrapper_name);
        session_.runtime.set_output(config_.printer);
        return result.map([](const Evaluated<std::string>&) { return true; });
    } catch (const std::exception& e) {
        session_.runtime.set_output(config_.printer);
        return unexpected_failure(e);
    }
}

Res<std::vector<Decl>> Interpreter::decls(const std::string& code) const {
    ParseOutcome parsed = parser_.parse(code, std::to_string(session_.line));
    switch (parsed.kind) {
        case ParseOutcome::Kind::Declarations:
            return Res<std::vector<Decl>>::success(std::move(parsed.decls));
        case ParseOutcome::Kind::Blank:
            return Res<std::vector<Decl>>::success({});
        case ParseOutcome::Kind::Incomplete:
            return Failure{"incomplete input", std::nullopt};
        case ParseOutcome::Kind::ParseError:
            break;
    }
    return Failure{parsed.text, std::nullopt};
}

backend::compiler::Completion Interpreter::complete(std::size_t cursor, const std::string& text) {
    backend::compiler::Completion completion =
        session_.compiler->complete(cursor, session_.ledger.previous_import_block(), text);
    auto& candidates = completion.candidates;
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
        [this](const std::string& name) { return session_.unfinished.count(name) > 0; }), candidates.end());
    return completion;
}

Res<bool> Interpreter::set_shared_compile_execute_mode(bool enabled) {
    if (!session_.registry.set_shared_compile_execute_mode(enabled)) {
        return Res<bool>::success(false);
    }

    // the old generation is gone together with every wrapper compiled into it
    session_.ledger.clear();
    session_.sources.clear();
    session_.unfinished.clear();
    session_.compiler->reset();
    return start().map([](const bool&) { return true; });
}

Res<std::vector<std::string>> Interpreter::add_libraries(const std::vector<std::string>& coordinates, ClassLoaderTier tier) {
    auto paths = resolver_->resolve(coordinates);
    if (!paths) {
        return Failure{llvm::toString(paths.takeError()), std::nullopt};
    }
    return Res<std::vector<std::string>>::success(session_.registry.add_paths(tier, *paths));
}

void Interpreter::stop() {
    std::vector<std::function<void()>> hooks;
    hooks.swap(stop_hooks_);
    for (auto& hook : hooks) {
        hook();
    }
}

} // namespace kiln::frontend::interactive
