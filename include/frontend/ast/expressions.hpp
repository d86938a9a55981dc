#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "frontend/ast/types.hpp"
#include "frontend/lexer/token.hpp"

namespace kiln::frontend {
struct MemberSymbol;
struct ContainerSymbol;
} // namespace kiln::frontend

namespace kiln::frontend::ast {

enum class RefKind {
    Unresolved,
    Local,
    ModuleMember,
    ClassMember,
    Container,
    Show,
};

/**
 * What a name or selection refers to once the typer has run.
 *
 * Names bound by an import are expanded into `alias`, a synthesized path
 * expression that is typed and generated in place of the name.
 */
struct Resolution {
    RefKind kind = RefKind::Unresolved;
    int local_id = -1;
    const MemberSymbol* member = nullptr;
    const ContainerSymbol* container = nullptr;
    bool implicit_this = false;
    // a nullary def referenced without an argument list
    bool auto_call = false;
    std::unique_ptr<Expr> alias;
};

class IntLiteralNode : public Expr {
public:
    std::int64_t value;
    explicit IntLiteralNode(std::int64_t v) : Expr(NodeType::IntLiteral), value(v) {}
};

class StringLiteralNode : public Expr {
public:
    std::string value;
    explicit StringLiteralNode(std::string v) : Expr(NodeType::StringLiteral), value(std::move(v)) {}
};

class UnitLiteralNode : public Expr {
public:
    UnitLiteralNode() : Expr(NodeType::UnitLiteral) {}
};

class NameNode : public Expr {
public:
    std::string name;
    Resolution resolution;
    explicit NameNode(std::string n) : Expr(NodeType::Name), name(std::move(n)) {}
};

class ThisNode : public Expr {
public:
    ThisNode() : Expr(NodeType::This) {}
};

class SelectNode : public Expr {
public:
    std::unique_ptr<Expr> object;
    std::string member;
    Resolution resolution;

    SelectNode(std::unique_ptr<Expr> obj, std::string m)
        : Expr(NodeType::Select), object(std::move(obj)), member(std::move(m)) {}
};

class CallNode : public Expr {
public:
    std::unique_ptr<Expr> callee;
    ExprList args;

    CallNode(std::unique_ptr<Expr> c, ExprList a)
        : Expr(NodeType::Call), callee(std::move(c)), args(std::move(a)) {}
};

class NewNode : public Expr {
public:
    // Name/Select path naming the class
    std::unique_ptr<Expr> target;
    ExprList args;
    const ContainerSymbol* cls = nullptr;

    NewNode(std::unique_ptr<Expr> t, ExprList a)
        : Expr(NodeType::New), target(std::move(t)), args(std::move(a)) {}
};

class BinaryNode : public Expr {
public:
    TokenType op;
    std::unique_ptr<Expr> left;
    std::unique_ptr<Expr> right;

    BinaryNode(TokenType o, std::unique_ptr<Expr> l, std::unique_ptr<Expr> r)
        : Expr(NodeType::Binary), op(o), left(std::move(l)), right(std::move(r)) {}
};

class UnaryNode : public Expr {
public:
    TokenType op;
    std::unique_ptr<Expr> operand;

    UnaryNode(TokenType o, std::unique_ptr<Expr> e)
        : Expr(NodeType::Unary), op(o), operand(std::move(e)) {}
};

class IfNode : public Expr {
public:
    std::unique_ptr<Expr> condition;
    std::unique_ptr<Expr> then_branch;
    std::unique_ptr<Expr> else_branch;

    IfNode(std::unique_ptr<Expr> c, std::unique_ptr<Expr> t, std::unique_ptr<Expr> e)
        : Expr(NodeType::If), condition(std::move(c)), then_branch(std::move(t)), else_branch(std::move(e)) {}
};

// Statements are ValNode (locals) or ExprStatementNode.
class BlockNode : public Expr {
public:
    NodeList statements;
    explicit BlockNode(NodeList s) : Expr(NodeType::Block), statements(std::move(s)) {}
};

} // namespace kiln::frontend::ast
