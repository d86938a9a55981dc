#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "frontend/lexer/token.hpp"

namespace kiln::frontend {

class LexError : public std::runtime_error {
public:
    LexError(const std::string& message, std::size_t line, std::size_t column)
        : std::runtime_error(message), line(line), column(column) {}

    std::size_t line;
    std::size_t column;
};

/**
 * Lexer
 *
 * Produces the token stream shared by the fragment splitter and the parser.
 * Newlines are kept as NEWLINE tokens (runs collapse into one) because they
 * separate statements outside of parentheses.
 */
class Lexer {
public:
    explicit Lexer(std::string src);

    std::vector<Token> tokenize();

private:
    bool is_eof() const;
    char peek(std::size_t ahead = 0) const;
    void advance();
    void skip_blanks();
    void skip_comment();

    std::string input_;
    std::size_t position_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

} // namespace kiln::frontend
