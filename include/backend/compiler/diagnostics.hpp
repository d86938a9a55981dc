#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kiln::backend::compiler {

struct Diagnostic {
    std::string file;
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
    // source line the position points into, empty when unknown
    std::string context_line;

    // "file:line:col: ERROR: message" followed by the source line and a caret
    std::string render() const;
};

// Builds a diagnostic for `source`, filling in the context line.
Diagnostic make_diagnostic(const std::string& source, std::size_t line, std::size_t column, const std::string& message);

class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void report(const Diagnostic& diagnostic) = 0;
};

class CollectingSink : public DiagnosticSink {
public:
    void report(const Diagnostic& diagnostic) override { diagnostics_.push_back(diagnostic); }

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    bool empty() const { return diagnostics_.empty(); }
    std::string render() const;

private:
    std::vector<Diagnostic> diagnostics_;
};

} // namespace kiln::backend::compiler
