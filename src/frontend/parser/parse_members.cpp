#include "frontend/parser/parser.hpp"

namespace kiln::frontend {

namespace {

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& segment : path) {
        if (!out.empty()) out += '.';
        out += segment;
    }
    return out;
}

} // namespace

std::string ast::TypeRef::to_string() const {
    return join_path(path);
}

std::string ast::ImportNode::prefix_text() const {
    return join_path(prefix);
}

std::unique_ptr<ast::ImportNode> Parser::parse_import() {
    Token start = expect(TokenType::IMPORT, "'import'");
    auto node = std::make_unique<ast::ImportNode>();
    node->position = position_of(start);

    node->prefix.push_back(expect(TokenType::IDENTIFIER, "import path").lexeme);
    if (node->prefix.back() == "_") {
        error_at(start, "import requires a qualified path");
    }

    while (true) {
        if (!accept(TokenType::DOT)) break;

        const Token& next = current_token();
        if (next.type == TokenType::OBRACE) {
            consume_token();
            skip_newlines();
            while (true) {
                Token name = expect(TokenType::IDENTIFIER, "import selector");
                skip_newlines();
                if (name.lexeme == "_") {
                    node->wildcard = true;
                } else if (accept(TokenType::ARROW)) {
                    skip_newlines();
                    Token alias = expect(TokenType::IDENTIFIER, "import alias");
                    node->selectors.push_back({name.lexeme, alias.lexeme});
                } else {
                    node->selectors.push_back({name.lexeme, name.lexeme});
                }
                skip_newlines();
                if (!accept(TokenType::COMMA)) break;
                skip_newlines();
            }
            expect(TokenType::CBRACE, "'}' closing import selectors");
            break;
        }

        Token name = expect(TokenType::IDENTIFIER, "import path segment");
        if (name.lexeme == "_") {
            node->wildcard = true;
            break;
        }
        node->prefix.push_back(name.lexeme);
    }

    if (!node->wildcard && node->selectors.empty()) {
        if (node->prefix.size() < 2) {
            error_at(start, "import requires a qualified path");
        }
        std::string last = node->prefix.back();
        node->prefix.pop_back();
        node->selectors.push_back({last, last});
    }

    return node;
}

std::unique_ptr<ast::ContainerNode> Parser::parse_container(bool exported) {
    Token keyword = consume_token();
    auto node = std::make_unique<ast::ContainerNode>();
    node->position = position_of(keyword);
    node->exported = exported;
    node->container_kind = keyword.type == TokenType::CLASS ? ast::ContainerKind::Class : ast::ContainerKind::Module;
    node->name = expect(TokenType::IDENTIFIER, keyword.type == TokenType::CLASS ? "class name" : "module name").lexeme;

    if (node->container_kind == ast::ContainerKind::Class && current_token().type == TokenType::OPAREN) {
        node->ctor_params = parse_params();
    }

    if (current_token().type == TokenType::OBRACE) {
        parse_body(node->members, false);
    } else if (node->container_kind == ast::ContainerKind::Module) {
        error("expected '{' after module name");
    }

    return node;
}

void Parser::parse_body(ast::NodeList& out, bool block) {
    expect(TokenType::OBRACE, "'{'");
    int saved_depth = paren_depth_;
    paren_depth_ = 0;

    skip_separators();
    while (current_token().type != TokenType::CBRACE) {
        if (!not_eof()) {
            error("expected '}' before end of input");
        }

        if (block) {
            const Token& token = current_token();
            if (token.type == TokenType::VAL) {
                out.push_back(parse_val(false, false, false));
            } else if (token.type == TokenType::DEF || token.type == TokenType::CLASS ||
                       token.type == TokenType::MODULE || token.type == TokenType::IMPORT) {
                error("only 'val' definitions and expressions are allowed inside a block");
            } else {
                auto stmt = parse_expr();
                out.push_back(std::make_unique<ast::ExprStatementNode>(std::move(stmt)));
            }
        } else {
            out.push_back(parse_member());
        }

        TokenType sep = current_token().type;
        if (sep == TokenType::CBRACE) break;
        if (sep != TokenType::NEWLINE && sep != TokenType::SEMICOLON) {
            error("expected ';' or newline between statements");
        }
        skip_separators();
    }

    paren_depth_ = saved_depth;
    expect(TokenType::CBRACE, "'}'");
}

std::unique_ptr<ast::Node> Parser::parse_member() {
    const Token& first = current_token();
    if (first.type == TokenType::IMPORT) {
        return parse_import();
    }
    if (first.type == TokenType::EXPORT) {
        error("'export' is only allowed on top-level modules and classes");
    }

    Token start = first;
    bool implicit = false;
    bool lazy = false;
    bool is_inline = false;
    bool is_extern = false;
    bool any_modifier = false;

    while (true) {
        TokenType t = current_token().type;
        if (t == TokenType::IMPLICIT) implicit = true;
        else if (t == TokenType::LAZY) lazy = true;
        else if (t == TokenType::INLINE) is_inline = true;
        else if (t == TokenType::EXTERN) is_extern = true;
        else break;
        any_modifier = true;
        consume_token();
    }

    switch (current_token().type) {
        case TokenType::VAL:
            if (is_extern) error_at(start, "'extern' applies to 'def' only");
            if (lazy && is_inline) error_at(start, "a val cannot be both 'lazy' and 'inline'");
            return parse_val(implicit, lazy, is_inline);
        case TokenType::DEF:
            if (lazy || is_inline) error_at(start, "'lazy' and 'inline' apply to 'val' only");
            if (is_extern && implicit) error_at(start, "an extern def cannot be implicit");
            return parse_def(implicit, is_extern);
        case TokenType::CLASS:
        case TokenType::MODULE:
            if (any_modifier) error_at(start, "modifiers are not allowed on nested modules and classes");
            return parse_container(false);
        default:
            break;
    }

    if (any_modifier) {
        error("expected 'val' or 'def' after modifier");
    }

    auto expr = parse_expr();
    auto stmt = std::make_unique<ast::ExprStatementNode>(std::move(expr));
    stmt->position = position_of(start);
    return stmt;
}

std::unique_ptr<ast::ValNode> Parser::parse_val(bool implicit, bool lazy, bool is_inline) {
    Token keyword = expect(TokenType::VAL, "'val'");
    auto node = std::make_unique<ast::ValNode>();
    node->position = position_of(keyword);
    node->implicit = implicit;
    node->lazy = lazy;
    node->is_inline = is_inline;
    node->name = expect(TokenType::IDENTIFIER, "value name").lexeme;

    if (accept(TokenType::COLON)) {
        node->annotation = parse_type();
    }
    expect(TokenType::ASSIGNMENT, "'='");
    skip_newlines();
    node->init = parse_expr();
    return node;
}

std::unique_ptr<ast::Node> Parser::parse_def(bool implicit, bool is_extern) {
    Token keyword = expect(TokenType::DEF, "'def'");
    Token name = expect(TokenType::IDENTIFIER, "function name");

    if (is_extern) {
        auto node = std::make_unique<ast::ExternNode>();
        node->position = position_of(keyword);
        node->name = name.lexeme;
        node->params = parse_params();
        expect(TokenType::COLON, "':' and the result type of an extern def");
        node->result = parse_type();
        return node;
    }

    auto node = std::make_unique<ast::DefNode>();
    node->position = position_of(keyword);
    node->name = name.lexeme;
    node->implicit = implicit;
    if (current_token().type == TokenType::OPAREN) {
        node->params = parse_params();
    } else {
        node->has_parens = false;
    }
    if (accept(TokenType::COLON)) {
        node->result = parse_type();
    }
    expect(TokenType::ASSIGNMENT, "'='");
    skip_newlines();
    node->body = parse_expr();
    return node;
}

std::vector<ast::ParamDecl> Parser::parse_params() {
    expect(TokenType::OPAREN, "'('");
    ++paren_depth_;

    std::vector<ast::ParamDecl> params;
    if (current_token().type != TokenType::CPAREN) {
        while (true) {
            ast::ParamDecl param;
            param.name = expect(TokenType::IDENTIFIER, "parameter name").lexeme;
            expect(TokenType::COLON, "':' and a parameter type");
            param.type = parse_type();
            params.push_back(std::move(param));
            if (!accept(TokenType::COMMA)) break;
        }
    }

    expect(TokenType::CPAREN, "')'");
    --paren_depth_;
    return params;
}

ast::TypeRef Parser::parse_type() {
    Token first = expect(TokenType::IDENTIFIER, "type name");
    ast::TypeRef ref;
    ref.position = position_of(first);
    ref.path.push_back(first.lexeme);
    while (current_token().type == TokenType::DOT) {
        consume_token();
        ref.path.push_back(expect(TokenType::IDENTIFIER, "type name").lexeme);
    }
    return ref;
}

} // namespace kiln::frontend
