#include "frontend/parser/parser.hpp"

#include <sstream>

namespace kiln::frontend {

bool Parser::not_eof() {
    return current_token().type != TokenType::EOF_TOKEN;
}

const Token& Parser::current_token() {
    if (paren_depth_ > 0) {
        while (index_ + 1 < tokens_.size() && tokens_[index_].type == TokenType::NEWLINE) {
            ++index_;
        }
    }
    return tokens_[index_];
}

const Token& Parser::peek_past_newlines() {
    std::size_t i = index_;
    while (i + 1 < tokens_.size() && tokens_[i].type == TokenType::NEWLINE) {
        ++i;
    }
    return tokens_[i];
}

Token Parser::consume_token() {
    Token token = current_token();
    if (index_ + 1 < tokens_.size()) ++index_;
    return token;
}

Token Parser::expect(TokenType expected_type, const std::string& what) {
    const Token& token = current_token();
    if (token.type != expected_type) {
        std::ostringstream oss;
        oss << "expected " << what << " but found ";
        if (token.type == TokenType::IDENTIFIER || token.type == TokenType::NUMBER) {
            oss << "'" << token.lexeme << "'";
        } else {
            oss << get_token_name(token.type);
        }
        error(oss.str());
    }
    return consume_token();
}

bool Parser::accept(TokenType type) {
    if (current_token().type != type) return false;
    consume_token();
    return true;
}

void Parser::skip_newlines() {
    while (index_ + 1 < tokens_.size() && tokens_[index_].type == TokenType::NEWLINE) {
        ++index_;
    }
}

void Parser::skip_separators() {
    while (index_ + 1 < tokens_.size() &&
           (tokens_[index_].type == TokenType::NEWLINE || tokens_[index_].type == TokenType::SEMICOLON)) {
        ++index_;
    }
}

void Parser::error(const std::string& message) {
    error_at(current_token(), message);
}

void Parser::error_at(const Token& token, const std::string& message) {
    throw CompileError(message, token.line, token.column_start);
}

std::unique_ptr<ast::PositionData> Parser::position_of(const Token& token) const {
    return std::make_unique<ast::PositionData>(
        token.line, token.column_start, token.column_end, token.position_start, token.position_end);
}

std::unique_ptr<ast::Program> Parser::produce_ast(const std::vector<Token>& tokens) {
    tokens_ = tokens;
    if (tokens_.empty() || tokens_.back().type != TokenType::EOF_TOKEN) {
        tokens_.emplace_back(TokenType::EOF_TOKEN, "", 0, 0, 0, 0, 0);
    }
    index_ = 0;
    paren_depth_ = 0;

    auto program = std::make_unique<ast::Program>();
    program->position = position_of(tokens_.front());

    skip_separators();
    while (not_eof()) {
        const Token& token = current_token();
        if (token.type == TokenType::IMPORT) {
            program->imports.push_back(parse_import());
        } else {
            bool exported = accept(TokenType::EXPORT);
            TokenType kind = current_token().type;
            if (kind != TokenType::MODULE && kind != TokenType::CLASS) {
                error("expected 'module' or 'class' at top level");
            }
            program->items.push_back(parse_container(exported));
        }

        if (not_eof()) {
            TokenType sep = current_token().type;
            if (sep != TokenType::NEWLINE && sep != TokenType::SEMICOLON) {
                error("expected ';' or newline after top-level definition");
            }
        }
        skip_separators();
    }

    return program;
}

std::unique_ptr<ast::Expr> Parser::produce_expr(const std::vector<Token>& tokens) {
    tokens_ = tokens;
    if (tokens_.empty() || tokens_.back().type != TokenType::EOF_TOKEN) {
        tokens_.emplace_back(TokenType::EOF_TOKEN, "", 0, 0, 0, 0, 0);
    }
    index_ = 0;
    paren_depth_ = 0;

    skip_separators();
    auto expr = parse_expr();
    skip_separators();
    if (not_eof()) {
        error("unexpected trailing input");
    }
    return expr;
}

} // namespace kiln::frontend
