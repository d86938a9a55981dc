#include "frontend/lexer/identifier_tokenizer.hpp"

#include <cctype>

namespace kiln::frontend {

Token tokenize_identifier_or_keyword(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column) {
    std::string value;
    std::size_t start_column = column;
    std::size_t start_position = pos;

    while (pos < input.size() && (std::isalnum(static_cast<unsigned char>(input[pos])) || input[pos] == '_' || input[pos] == '$')) {
        value += input[pos];
        ++pos;
        ++column;
    }

    TokenType type = TokenType::IDENTIFIER;

         if (value == "val") type = TokenType::VAL;
    else if (value == "lazy") type = TokenType::LAZY;
    else if (value == "inline") type = TokenType::INLINE;
    else if (value == "implicit") type = TokenType::IMPLICIT;
    else if (value == "def") type = TokenType::DEF;
    else if (value == "extern") type = TokenType::EXTERN;
    else if (value == "class") type = TokenType::CLASS;
    else if (value == "module") type = TokenType::MODULE;
    else if (value == "export") type = TokenType::EXPORT;
    else if (value == "import") type = TokenType::IMPORT;
    else if (value == "new") type = TokenType::NEW;
    else if (value == "this") type = TokenType::THIS;
    else if (value == "if") type = TokenType::IF;
    else if (value == "else") type = TokenType::ELSE;

    return Token(type, value, line, start_column, column, start_position, pos);
}

} // namespace kiln::frontend
