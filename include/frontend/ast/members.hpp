#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "frontend/ast/expressions.hpp"

namespace kiln::frontend::ast {

struct TypeRef {
    // "Int", "Str", "Unit" or a path to a class
    std::vector<std::string> path;
    std::unique_ptr<PositionData> position;

    std::string to_string() const;
};

struct ParamDecl {
    std::string name;
    TypeRef type;
};

struct ImportSelector {
    std::string name;
    std::string alias;
    // set by the typer from the imported member
    bool implicit = false;
};

class ImportNode : public Node {
public:
    std::vector<std::string> prefix;
    std::vector<ImportSelector> selectors;
    bool wildcard = false;

    // prefix rewritten by the typer so it resolves from any later unit
    std::string resolved_prefix;
    // resolved_prefix starts at a member of the unit's exported class
    bool relative_prefix = false;

    ImportNode() : Node(NodeType::Import) {}

    std::string prefix_text() const;
};

class ValNode : public Node {
public:
    std::string name;
    std::optional<TypeRef> annotation;
    std::unique_ptr<Expr> init;
    bool lazy = false;
    bool is_inline = false;
    bool implicit = false;

    // set for block locals
    int local_id = -1;
    MemberSymbol* symbol = nullptr;

    ValNode() : Node(NodeType::Val) {}
};

class DefNode : public Node {
public:
    std::string name;
    std::vector<ParamDecl> params;
    bool has_parens = true;
    std::optional<TypeRef> result;
    std::unique_ptr<Expr> body;
    bool implicit = false;

    std::vector<int> param_ids;
    MemberSymbol* symbol = nullptr;

    DefNode() : Node(NodeType::Def) {}
};

class ExternNode : public Node {
public:
    std::string name;
    std::vector<ParamDecl> params;
    TypeRef result;
    MemberSymbol* symbol = nullptr;

    ExternNode() : Node(NodeType::Extern) {}
};

enum class ContainerKind {
    Module,
    Class,
};

class ContainerNode : public Node {
public:
    ContainerKind container_kind = ContainerKind::Module;
    std::string name;
    bool exported = false;
    std::vector<ParamDecl> ctor_params;
    NodeList members;

    ContainerSymbol* symbol = nullptr;

    ContainerNode() : Node(NodeType::Container) {}
};

class ExprStatementNode : public Node {
public:
    std::unique_ptr<Expr> expr;
    explicit ExprStatementNode(std::unique_ptr<Expr> e) : Node(NodeType::ExprStatement), expr(std::move(e)) {}
};

} // namespace kiln::frontend::ast
