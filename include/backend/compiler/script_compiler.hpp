#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend/compiler/compiler.hpp"
#include "backend/registry/artifact_registry.hpp"
#include "backend/runtime/runtime_context.hpp"
#include "frontend/ast/ast.hpp"
#include "frontend/checker/symbols.hpp"

namespace kiln::backend::compiler {

/**
 * ScriptCompiler
 *
 * Lexes, parses and types a unit against the symbols of every unit compiled
 * before it, then lowers each top-level container to a bitcode artifact.
 *
 * `inline val` initializers run on the registry's CompilerInternal loader
 * under a runtime context owned by the compiler. Extern symbols must resolve
 * through the Runtime loader.
 */
class ScriptCompiler : public Compiler {
public:
    explicit ScriptCompiler(registry::ArtifactRegistry& registry);

    std::optional<CompileOutput> compile(const std::string& source, DiagnosticSink& sink) override;
    Completion complete(std::size_t cursor, const std::string& preamble, const std::string& text) override;
    void reset() override;

    const frontend::SymbolTable& symbols() const { return symbols_; }

private:
    std::optional<std::int64_t> evaluate_inline(const frontend::ast::Expr& init, std::string& error);
    bool extern_visible(const std::string& symbol);

    registry::ArtifactRegistry& registry_;
    frontend::SymbolTable symbols_;
    runtime::RuntimeContext inline_context_;
    unsigned next_probe_ = 0;
};

// Import entries a unit exports: members and imports of its exported container.
std::vector<frontend::interactive::ImportEntry> collect_exports(const frontend::ast::Program& program);

} // namespace kiln::backend::compiler
