#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "frontend/checker/type.hpp"

namespace kiln::frontend::ast {

enum class NodeType {
    IntLiteral,
    StringLiteral,
    UnitLiteral,
    Name,
    This,
    Select,
    Call,
    New,
    Binary,
    Unary,
    If,
    Block,

    Import,
    Val,
    Def,
    Extern,
    Container,
    ExprStatement,

    Program,
};

class PositionData {
public:
    std::size_t line;
    std::size_t col[2];
    std::size_t pos[2];

    PositionData(std::size_t line, std::size_t col_start, std::size_t col_end, std::size_t pos_start, std::size_t pos_end)
        : line(line), col{col_start, col_end}, pos{pos_start, pos_end} {}
};

class Node {
public:
    NodeType kind;
    std::unique_ptr<PositionData> position;

    explicit Node(NodeType k) : kind(k) {}
    virtual ~Node() = default;
};

class Expr : public Node {
public:
    explicit Expr(NodeType k) : Node(k) {}

    // filled by the typer
    Type type;
};

using NodeList = std::vector<std::unique_ptr<Node>>;
using ExprList = std::vector<std::unique_ptr<Expr>>;

} // namespace kiln::frontend::ast
