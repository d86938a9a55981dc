#include "frontend/parser/parser.hpp"

#include <string>

namespace kiln::frontend {

namespace {

// Binary operator table from loosest to tightest binding.
const std::vector<std::vector<TokenType>> kPrecedence = {
    {TokenType::OR},
    {TokenType::AND},
    {TokenType::EQUALS, TokenType::DIFFERENT},
    {TokenType::LT, TokenType::LESS_THAN_EQUALS, TokenType::GT, TokenType::GREATER_THAN_EQUALS},
    {TokenType::PLUS, TokenType::MINUS, TokenType::CONCAT},
    {TokenType::MUL, TokenType::DIV, TokenType::MOD},
};

bool in_level(TokenType type, int level) {
    for (TokenType t : kPrecedence[level]) {
        if (t == type) return true;
    }
    return false;
}

} // namespace

std::unique_ptr<ast::Expr> Parser::parse_expr() {
    if (current_token().type == TokenType::IF) {
        return parse_if();
    }
    return parse_binary(0);
}

std::unique_ptr<ast::Expr> Parser::parse_if() {
    Token keyword = expect(TokenType::IF, "'if'");
    expect(TokenType::OPAREN, "'(' after 'if'");
    ++paren_depth_;
    auto condition = parse_expr();
    expect(TokenType::CPAREN, "')' closing the condition");
    --paren_depth_;

    skip_newlines();
    auto then_branch = parse_expr();

    std::unique_ptr<ast::Expr> else_branch;
    if (peek_past_newlines().type == TokenType::ELSE) {
        skip_newlines();
        consume_token();
        skip_newlines();
        else_branch = parse_expr();
    }

    auto node = std::make_unique<ast::IfNode>(std::move(condition), std::move(then_branch), std::move(else_branch));
    node->position = position_of(keyword);
    return node;
}

std::unique_ptr<ast::Expr> Parser::parse_binary(int level) {
    if (level >= static_cast<int>(kPrecedence.size())) {
        return parse_unary();
    }

    auto left = parse_binary(level + 1);
    while (in_level(current_token().type, level)) {
        Token op = consume_token();
        skip_newlines();
        std::unique_ptr<ast::Expr> right;
        if (current_token().type == TokenType::IF) {
            right = parse_if();
        } else {
            right = parse_binary(level + 1);
        }
        auto node = std::make_unique<ast::BinaryNode>(op.type, std::move(left), std::move(right));
        node->position = position_of(op);
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ast::Expr> Parser::parse_unary() {
    const Token& token = current_token();
    if (token.type == TokenType::MINUS || token.type == TokenType::NOT) {
        Token op = consume_token();
        auto operand = parse_unary();
        auto node = std::make_unique<ast::UnaryNode>(op.type, std::move(operand));
        node->position = position_of(op);
        return node;
    }
    return parse_postfix();
}

std::unique_ptr<ast::Expr> Parser::parse_postfix() {
    auto expr = parse_primary();

    while (true) {
        if (peek_past_newlines().type == TokenType::DOT) {
            skip_newlines();
            consume_token();
            Token name = expect(TokenType::IDENTIFIER, "member name after '.'");
            auto node = std::make_unique<ast::SelectNode>(std::move(expr), name.lexeme);
            node->position = position_of(name);
            expr = std::move(node);
            continue;
        }

        if (current_token().type == TokenType::OPAREN) {
            Token open = current_token();
            auto args = parse_arguments();
            auto node = std::make_unique<ast::CallNode>(std::move(expr), std::move(args));
            node->position = position_of(open);
            expr = std::move(node);
            continue;
        }

        break;
    }

    return expr;
}

std::unique_ptr<ast::Expr> Parser::parse_primary() {
    const Token& token = current_token();

    switch (token.type) {
        case TokenType::NUMBER: {
            Token number = consume_token();
            auto node = std::make_unique<ast::IntLiteralNode>(std::stoll(number.lexeme));
            node->position = position_of(number);
            return node;
        }
        case TokenType::STRING: {
            Token str = consume_token();
            auto node = std::make_unique<ast::StringLiteralNode>(str.lexeme);
            node->position = position_of(str);
            return node;
        }
        case TokenType::IDENTIFIER: {
            Token id = consume_token();
            auto node = std::make_unique<ast::NameNode>(id.lexeme);
            node->position = position_of(id);
            return node;
        }
        case TokenType::THIS: {
            Token kw = consume_token();
            auto node = std::make_unique<ast::ThisNode>();
            node->position = position_of(kw);
            return node;
        }
        case TokenType::OPAREN: {
            Token open = consume_token();
            ++paren_depth_;
            if (current_token().type == TokenType::CPAREN) {
                consume_token();
                --paren_depth_;
                auto node = std::make_unique<ast::UnitLiteralNode>();
                node->position = position_of(open);
                return node;
            }
            auto inner = parse_expr();
            expect(TokenType::CPAREN, "')'");
            --paren_depth_;
            return inner;
        }
        case TokenType::OBRACE:
            return parse_block();
        case TokenType::NEW:
            return parse_new();
        case TokenType::IF:
            return parse_if();
        default:
            break;
    }

    if (token.type == TokenType::EOF_TOKEN) {
        error("expected expression before end of input");
    }
    error(std::string("expected expression but found ") + get_token_name(token.type));
}

std::unique_ptr<ast::Expr> Parser::parse_block() {
    Token open = current_token();
    ast::NodeList statements;
    parse_body(statements, true);
    auto node = std::make_unique<ast::BlockNode>(std::move(statements));
    node->position = position_of(open);
    return node;
}

std::unique_ptr<ast::Expr> Parser::parse_new() {
    Token keyword = expect(TokenType::NEW, "'new'");

    Token first = expect(TokenType::IDENTIFIER, "class name after 'new'");
    std::unique_ptr<ast::Expr> target = std::make_unique<ast::NameNode>(first.lexeme);
    target->position = position_of(first);
    while (current_token().type == TokenType::DOT) {
        consume_token();
        Token segment = expect(TokenType::IDENTIFIER, "class name");
        auto select = std::make_unique<ast::SelectNode>(std::move(target), segment.lexeme);
        select->position = position_of(segment);
        target = std::move(select);
    }

    ast::ExprList args;
    if (current_token().type == TokenType::OPAREN) {
        args = parse_arguments();
    }

    auto node = std::make_unique<ast::NewNode>(std::move(target), std::move(args));
    node->position = position_of(keyword);
    return node;
}

ast::ExprList Parser::parse_arguments() {
    expect(TokenType::OPAREN, "'('");
    ++paren_depth_;

    ast::ExprList args;
    if (current_token().type != TokenType::CPAREN) {
        while (true) {
            args.push_back(parse_expr());
            if (!accept(TokenType::COMMA)) break;
        }
    }

    expect(TokenType::CPAREN, "')' closing the argument list");
    --paren_depth_;
    return args;
}

} // namespace kiln::frontend
