#pragma once

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <optional>
#include <string>
#include <vector>

#include "backend/compiler/compiler.hpp"
#include "backend/registry/artifact_registry.hpp"
#include "backend/resolver/dependency_resolver.hpp"
#include "backend/runtime/runtime_context.hpp"
#include "frontend/interactive/bridge.hpp"
#include "frontend/interactive/fragment_parser.hpp"
#include "frontend/interactive/history.hpp"
#include "frontend/interactive/import_ledger.hpp"
#include "frontend/interactive/result.hpp"
#include "frontend/interactive/wrapper.hpp"

namespace kiln::frontend::interactive {

struct InterpreterConfig {
    WrapMode wrap = WrapMode::Object;
    bool shared_loader = false;
    bool plugins_enabled = true;
    BridgeConfig bridge = default_bridge();
    // run after the bridge as wrapper `predef`, empty for none
    std::string predef;
    // empty for no persisted history
    std::string history_file;
    std::vector<std::string> library_dirs;
    // where generated code prints; stdout when unset
    backend::runtime::RuntimeContext::OutputSink printer;
};

// Everything one session owns.
struct Session {
    backend::registry::ArtifactRegistry registry;
    ImportLedger ledger;
    backend::runtime::RuntimeContext runtime;
    std::unique_ptr<backend::compiler::Compiler> compiler;
    int line = 0;
    std::vector<std::string> history;
    // wrapper name -> source, for wrappers that ran
    std::map<std::string, std::string> sources;
    // compiled but failed before their imports were recorded
    std::set<std::string> unfinished;
};

/**
 * Interpreter
 *
 * Runs fragments through parse, wrap, compile, load, invoke and import.
 * The line counter moves once per fragment that got as far as wrapping,
 * whatever happens after that. Incomplete input is held back and prepended
 * to the next fragment.
 */
class Interpreter {
public:
    explicit Interpreter(InterpreterConfig config);

    // Runs the bridge and the predef code. Must succeed before process().
    Res<bool> start();

    Res<std::string> process(const std::string& text);

    // Evaluates code under a fixed wrapper name without advancing the line
    // counter or printing.
    Res<bool> run(const std::string& code, const std::string& wrapper_name);

    Res<std::vector<Decl>> decls(const std::string& code) const;

    backend::compiler::Completion complete(std::size_t cursor, const std::string& text);

    // On a loader swap the session is rebuilt from the bridge and predef.
    Res<bool> set_shared_compile_execute_mode(bool enabled);

    Res<std::vector<std::string>> add_libraries(const std::vector<std::string>& coordinates,
                                                backend::registry::ClassLoaderTier tier);

    void on_stop(std::function<void()> hook) { stop_hooks_.push_back(std::move(hook)); }
    void stop();

    bool buffering() const { return buffer_.has_value(); }

    const std::map<std::string, std::string>& sources() const { return session_.sources; }
    int line() const { return session_.line; }
    const std::vector<std::string>& history() const { return session_.history; }
    const ImportLedger& ledger() const { return session_.ledger; }
    backend::registry::ArtifactRegistry& registry() { return session_.registry; }

private:
    Res<Evaluated<std::string>> evaluate(const std::vector<Decl>& decls, const std::string& candidate_name);
    void advance(const std::string& text);

    InterpreterConfig config_;
    Session session_;
    FragmentParser parser_;
    Wrapper wrapper_;
    std::unique_ptr<backend::resolver::DependencyResolver> resolver_;
    std::optional<HistoryFile> history_file_;
    std::optional<std::string> buffer_;
    std::vector<std::function<void()>> stop_hooks_;
};

} // namespace kiln::frontend::interactive
