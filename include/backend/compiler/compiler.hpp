#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "backend/compiler/diagnostics.hpp"
#include "backend/registry/artifact_registry.hpp"
#include "frontend/interactive/import_ledger.hpp"

namespace kiln::backend::compiler {

struct CompileOutput {
    std::vector<registry::Artifact> artifacts;
    // members and imports of the unit's exported container
    std::vector<frontend::interactive::ImportEntry> exported;
};

struct Completion {
    // offset in the text where the completed word starts
    std::size_t start = 0;
    std::vector<std::string> candidates;
};

class Compiler {
public:
    virtual ~Compiler() = default;

    // Diagnostics go to `sink`; nothing is committed when compilation fails.
    virtual std::optional<CompileOutput> compile(const std::string& source, DiagnosticSink& sink) = 0;

    // Non-committing completion of `text` at `cursor`, with `preamble` in scope.
    virtual Completion complete(std::size_t cursor, const std::string& preamble, const std::string& text) = 0;

    // Forgets every committed symbol.
    virtual void reset() = 0;
};

} // namespace kiln::backend::compiler
