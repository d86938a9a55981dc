#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace kiln::frontend {

// Thrown by the parser and the typer; converted to a diagnostic by the compiler.
class CompileError : public std::runtime_error {
public:
    CompileError(const std::string& message, std::size_t line, std::size_t column)
        : std::runtime_error(message), line(line), column(column) {}

    std::size_t line;
    std::size_t column;
};

} // namespace kiln::frontend
