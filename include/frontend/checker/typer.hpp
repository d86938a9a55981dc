#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "frontend/ast/ast.hpp"
#include "frontend/checker/symbols.hpp"
#include "frontend/compile_error.hpp"

namespace kiln::frontend {

// Runs an Int-typed `inline val` initializer; returns nullopt and sets `error` on failure.
using InlineEvaluator = std::function<std::optional<std::int64_t>(const ast::Expr& init, std::string& error)>;

// Whether an extern symbol is visible to the code that will run the unit.
using ExternChecker = std::function<bool(const std::string& symbol)>;

/**
 * Typer
 *
 * Resolves names and checks types of one compilation unit against the
 * committed symbol table. Annotates the AST in place (expression types,
 * resolutions, member symbols) for the code generator and throws
 * CompileError on the first error.
 *
 * Members are checked on demand, so a val may use a def declared after it.
 * A def referenced while its own body is being checked needs a result type.
 */
class Typer {
public:
    Typer(const SymbolTable& globals, InlineEvaluator evaluate_inline, ExternChecker check_extern);

    // Returns the unit's top-level containers, ready to commit.
    std::vector<std::shared_ptr<ContainerSymbol>> check(ast::Program& program);

private:
    static constexpr std::size_t kNoLimit = std::numeric_limits<std::size_t>::max();

    // A path used as an import prefix, after alias expansion. `relative` is
    // set when it starts at a member of the unit's exported class.
    struct ResolvedPath {
        std::string text;
        bool relative = false;
    };

    struct Local {
        int id;
        Type type;
    };

    enum class ScopeKind {
        Unit,
        Container,
        Function,
        Block,
    };

    struct Scope {
        ScopeKind kind;
        Scope* parent = nullptr;
        ContainerSymbol* container = nullptr;
        std::unordered_map<std::string, Local> locals;
        std::vector<ast::ImportNode*> imports;
    };

    enum class CheckState {
        Pending,
        Checking,
        Done,
    };

    struct MemberDecl {
        MemberSymbol* symbol = nullptr;
        ast::Node* node = nullptr;
        Scope* scope = nullptr;
        CheckState state = CheckState::Pending;
        bool typed = false;
    };

    struct PrefixInfo {
        std::unique_ptr<ast::Expr> path;
        Type type;
    };

    // declarations (typer.cpp)
    std::shared_ptr<ContainerSymbol> declare_container(ast::ContainerNode& node, Scope* parent, const ContainerSymbol* owner, const std::string& artifact);
    void resolve_ctor_params(ast::ContainerNode& node);
    void check_container(ast::ContainerNode& node);
    void check_member(const MemberSymbol* member);
    void check_val(ast::ValNode& node, MemberDecl& decl);
    void check_def(ast::DefNode& node, MemberDecl& decl);
    void check_extern(ast::ExternNode& node, MemberDecl& decl);
    void check_import(ast::ImportNode& node, Scope* scope, std::size_t index);
    Type member_type(const MemberSymbol* member, const ast::PositionData* use);
    Type resolve_type(const ast::TypeRef& ref, Scope* scope);
    ResolvedPath path_text(const ast::Expr& path) const;

    // names and paths (typer_expressions.cpp)
    Type resolve_name(ast::NameNode& node, Scope* scope, std::size_t import_limit, bool callee);
    Type resolve_select(ast::SelectNode& node, Scope* scope, std::size_t import_limit, bool callee);
    Type check_path(ast::Expr& path, Scope* scope, std::size_t import_limit, bool callee);
    Type member_access(const MemberSymbol* member, ast::Resolution& resolution, bool callee, const ast::PositionData* pos);
    Type import_prefix_type(ast::ImportNode* import, Scope* scope, std::size_t index);
    std::unique_ptr<ast::Expr> make_path(const std::vector<std::string>& segments, const std::string& last, const ast::PositionData* pos) const;
    const ContainerSymbol* innermost_class(Scope* scope) const;

    // expressions (typer_expressions.cpp)
    Type check_expr(ast::Expr& expr, Scope* scope, bool callee = false);
    Type check_value(ast::Expr& expr, Scope* scope);
    Type check_call(ast::CallNode& node, Scope* scope);
    Type check_new(ast::NewNode& node, Scope* scope);
    Type check_binary(ast::BinaryNode& node, Scope* scope);
    Type check_block(ast::BlockNode& node, Scope* scope);
    void check_arguments(const std::vector<Param>& params, ast::ExprList& args, Scope* scope, const std::string& what, const ast::PositionData* pos);
    void apply_implicit_conversion(std::unique_ptr<ast::Expr>& operand, Scope* scope);
    static const MemberSymbol* callee_member(const ast::Expr& callee);

    [[noreturn]] static void error(const std::string& message, const ast::PositionData* pos);

    const SymbolTable& globals_;
    InlineEvaluator evaluate_inline_;
    ExternChecker check_extern_;

    std::deque<Scope> scopes_;
    std::unordered_map<std::string, std::shared_ptr<ContainerSymbol>> pending_;
    std::unordered_map<const MemberSymbol*, MemberDecl> decls_;
    std::unordered_map<const ast::ImportNode*, PrefixInfo> prefixes_;
    std::unordered_map<const ast::ContainerNode*, Scope*> container_scopes_;
    const ContainerSymbol* exported_class_ = nullptr;
    int next_local_ = 0;
};

} // namespace kiln::frontend
