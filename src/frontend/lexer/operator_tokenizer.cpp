#include "frontend/lexer/operator_tokenizer.hpp"

#include <utility>

#include "frontend/lexer/lexer.hpp"

namespace kiln::frontend {

namespace {

const std::pair<const char*, TokenType> kTwoCharOperators[] = {
    {"++", TokenType::CONCAT},
    {"==", TokenType::EQUALS},
    {"!=", TokenType::DIFFERENT},
    {"<=", TokenType::LESS_THAN_EQUALS},
    {">=", TokenType::GREATER_THAN_EQUALS},
    {"&&", TokenType::AND},
    {"||", TokenType::OR},
    {"=>", TokenType::ARROW},
};

const std::pair<char, TokenType> kOneCharOperators[] = {
    {'+', TokenType::PLUS},
    {'-', TokenType::MINUS},
    {'*', TokenType::MUL},
    {'/', TokenType::DIV},
    {'%', TokenType::MOD},
    {'<', TokenType::LT},
    {'>', TokenType::GT},
    {'!', TokenType::NOT},
    {'=', TokenType::ASSIGNMENT},
    {'.', TokenType::DOT},
    {',', TokenType::COMMA},
    {':', TokenType::COLON},
    {';', TokenType::SEMICOLON},
    {'(', TokenType::OPAREN},
    {')', TokenType::CPAREN},
    {'{', TokenType::OBRACE},
    {'}', TokenType::CBRACE},
};

} // namespace

Token tokenize_operator(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column) {
    std::size_t start_column = column;
    std::size_t start_position = pos;

    if (pos + 2 <= input.size()) {
        std::string candidate = input.substr(pos, 2);
        for (const auto& [text, type] : kTwoCharOperators) {
            if (candidate == text) {
                pos += 2;
                column += 2;
                return Token(type, candidate, line, start_column, column, start_position, pos);
            }
        }
    }

    char c = input[pos];
    for (const auto& [ch, type] : kOneCharOperators) {
        if (c == ch) {
            pos += 1;
            column += 1;
            return Token(type, std::string(1, c), line, start_column, column, start_position, pos);
        }
    }

    throw LexError(std::string("unexpected character '") + c + "'", line, column);
}

} // namespace kiln::frontend
