#pragma once

#include <memory>
#include <string>
#include <vector>

#include "frontend/ast/ast.hpp"
#include "frontend/compile_error.hpp"
#include "frontend/lexer/token.hpp"

namespace kiln::frontend {

/**
 * Parser
 *
 * Recursive descent over the token stream. Newlines end statements except
 * inside parentheses, after a binary operator, and before `else` or `.`.
 * Any syntax error throws CompileError carrying the offending position.
 */
class Parser {
public:
    Parser() = default;

    std::unique_ptr<ast::Program> produce_ast(const std::vector<Token>& tokens);

    // members and expressions parsed on their own, used by tests and completion
    std::unique_ptr<ast::Expr> produce_expr(const std::vector<Token>& tokens);

private:
    // token access
    bool not_eof();
    const Token& current_token();
    const Token& peek_past_newlines();
    Token consume_token();
    Token expect(TokenType expected_type, const std::string& what);
    bool accept(TokenType type);
    void skip_newlines();
    void skip_separators();
    [[noreturn]] void error(const std::string& message);
    [[noreturn]] void error_at(const Token& token, const std::string& message);
    std::unique_ptr<ast::PositionData> position_of(const Token& token) const;

    // members (parse_members.cpp)
    std::unique_ptr<ast::ImportNode> parse_import();
    std::unique_ptr<ast::ContainerNode> parse_container(bool exported);
    std::unique_ptr<ast::Node> parse_member();
    std::unique_ptr<ast::ValNode> parse_val(bool implicit, bool lazy, bool is_inline);
    std::unique_ptr<ast::Node> parse_def(bool implicit, bool is_extern);
    std::vector<ast::ParamDecl> parse_params();
    ast::TypeRef parse_type();
    void parse_body(ast::NodeList& out, bool block);

    // expressions (parse_expressions.cpp)
    std::unique_ptr<ast::Expr> parse_expr();
    std::unique_ptr<ast::Expr> parse_if();
    std::unique_ptr<ast::Expr> parse_binary(int level);
    std::unique_ptr<ast::Expr> parse_unary();
    std::unique_ptr<ast::Expr> parse_postfix();
    std::unique_ptr<ast::Expr> parse_primary();
    std::unique_ptr<ast::Expr> parse_block();
    std::unique_ptr<ast::Expr> parse_new();
    ast::ExprList parse_arguments();

    std::vector<Token> tokens_;
    std::size_t index_ = 0;
    int paren_depth_ = 0;
};

} // namespace kiln::frontend
