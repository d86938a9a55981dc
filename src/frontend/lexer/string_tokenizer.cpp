#include "frontend/lexer/string_tokenizer.hpp"

#include "frontend/lexer/lexer.hpp"

namespace kiln::frontend {

Token tokenize_string(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column) {
    std::size_t start_pos = pos;
    std::size_t start_col = column;

    // Advances the initial quote
    ++pos;
    ++column;

    std::string value;
    bool escaped = false;

    while (pos < input.size()) {
        char c = input[pos];

        if (escaped) {
            switch (c) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case '\\': value += '\\'; break;
                case '"': value += '"'; break;
                default:
                    throw LexError(std::string("invalid escape '\\") + c + "' in string literal", line, column);
            }
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == '"') {
            ++pos;
            ++column;
            return Token(TokenType::STRING, value, line, start_col, column, start_pos, pos);
        } else if (c == '\n') {
            throw LexError("line break not allowed inside string literal", line, column);
        } else {
            value += c;
        }

        ++pos;
        ++column;
    }

    throw LexError("unclosed string literal", line, start_col);
}

} // namespace kiln::frontend
