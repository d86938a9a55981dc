#include "frontend/lexer/number_tokenizer.hpp"

#include <cctype>

#include "frontend/lexer/lexer.hpp"

namespace kiln::frontend {

Token tokenize_number(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column) {
    std::string value;
    std::size_t start_column = column;
    std::size_t start_position = pos;

    while (pos < input.size() && std::isdigit(static_cast<unsigned char>(input[pos]))) {
        value += input[pos];
        ++pos;
        ++column;
    }

    if (pos < input.size() && (std::isalpha(static_cast<unsigned char>(input[pos])) || input[pos] == '_')) {
        throw LexError("malformed number literal '" + value + input[pos] + "'", line, column);
    }
    if (value.size() > 19 || (value.size() == 19 && value > "9223372036854775807")) {
        throw LexError("integer literal out of range: " + value, line, start_column);
    }

    return Token(TokenType::NUMBER, value, line, start_column, column, start_position, pos);
}

} // namespace kiln::frontend
