#include "backend/compiler/diagnostics.hpp"

#include <algorithm>

namespace kiln::backend::compiler {

namespace {

constexpr const char* kSourceName = "Main.kiln";

} // namespace

Diagnostic make_diagnostic(const std::string& source, std::size_t line, std::size_t column, const std::string& message) {
    Diagnostic diagnostic;
    diagnostic.file = kSourceName;
    diagnostic.line = line;
    diagnostic.column = column;
    diagnostic.message = message;

    if (line == 0) {
        return diagnostic;
    }
    std::size_t start = 0;
    for (std::size_t current = 1; current < line; ++current) {
        start = source.find('\n', start);
        if (start == std::string::npos) {
            return diagnostic;
        }
        ++start;
    }
    std::size_t end = source.find('\n', start);
    diagnostic.context_line = source.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return diagnostic;
}

std::string Diagnostic::render() const {
    std::string out = file + ":" + std::to_string(line) + ":" + std::to_string(column) + ": ERROR: " + message;
    if (context_line.empty()) {
        return out;
    }

    std::string shown = context_line;
    std::replace(shown.begin(), shown.end(), '\t', ' ');
    std::string number = std::to_string(line);
    out += "\n " + number + " |   " + shown;
    out += "\n " + std::string(number.size(), ' ') + " |   " + std::string(column > 0 ? column - 1 : 0, ' ') + "^";
    return out;
}

std::string CollectingSink::render() const {
    std::string out;
    for (const auto& diagnostic : diagnostics_) {
        if (!out.empty()) out += "\n";
        out += diagnostic.render();
    }
    return out;
}

} // namespace kiln::backend::compiler
