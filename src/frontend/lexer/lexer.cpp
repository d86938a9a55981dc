#include "frontend/lexer/lexer.hpp"

#include <cctype>

#include "frontend/lexer/identifier_tokenizer.hpp"
#include "frontend/lexer/number_tokenizer.hpp"
#include "frontend/lexer/operator_tokenizer.hpp"
#include "frontend/lexer/string_tokenizer.hpp"

namespace kiln::frontend {

Lexer::Lexer(std::string src) : input_(std::move(src)) {}

bool Lexer::is_eof() const {
    return position_ >= input_.size();
}

char Lexer::peek(std::size_t ahead) const {
    if (position_ + ahead >= input_.size()) return '\0';
    return input_[position_ + ahead];
}

void Lexer::advance() {
    if (is_eof()) return;
    if (input_[position_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++position_;
}

void Lexer::skip_blanks() {
    while (!is_eof() && peek() != '\n' && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void Lexer::skip_comment() {
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (!is_eof()) {
        skip_blanks();
        if (is_eof()) break;

        char c = peek();

        if (c == '/' && peek(1) == '/') {
            skip_comment();
            continue;
        }

        if (c == '\n') {
            std::size_t start_pos = position_;
            std::size_t start_col = column_;
            std::size_t start_line = line_;
            advance();
            if (!tokens.empty() && tokens.back().type != TokenType::NEWLINE) {
                tokens.emplace_back(TokenType::NEWLINE, "\\n", start_line, start_col, start_col + 1, start_pos, position_);
            }
            continue;
        }

        if (c == '"') {
            tokens.push_back(tokenize_string(input_, position_, line_, column_));
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
            tokens.push_back(tokenize_identifier_or_keyword(input_, position_, line_, column_));
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(tokenize_number(input_, position_, line_, column_));
            continue;
        }

        tokens.push_back(tokenize_operator(input_, position_, line_, column_));
    }

    tokens.emplace_back(TokenType::EOF_TOKEN, "", line_, column_, column_, position_, position_);
    return tokens;
}

} // namespace kiln::frontend
