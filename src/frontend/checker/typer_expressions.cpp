#include "frontend/checker/typer.hpp"

#include <algorithm>
#include <utility>

namespace kiln::frontend {

namespace {

std::unique_ptr<ast::PositionData> copy_position(const ast::PositionData* pos) {
    return pos ? std::make_unique<ast::PositionData>(*pos) : nullptr;
}

bool is_path(const ast::Expr& expr) {
    return expr.kind == ast::NodeType::Name || expr.kind == ast::NodeType::Select;
}

} // namespace

std::unique_ptr<ast::Expr> Typer::make_path(const std::vector<std::string>& segments, const std::string& last, const ast::PositionData* pos) const {
    std::unique_ptr<ast::Expr> path;
    for (const auto& segment : segments) {
        if (!path) {
            path = std::make_unique<ast::NameNode>(segment);
        } else {
            path = std::make_unique<ast::SelectNode>(std::move(path), segment);
        }
        path->position = copy_position(pos);
    }
    if (!path) {
        path = std::make_unique<ast::NameNode>(last);
    } else {
        path = std::make_unique<ast::SelectNode>(std::move(path), last);
    }
    path->position = copy_position(pos);
    return path;
}

const ContainerSymbol* Typer::innermost_class(Scope* scope) const {
    for (Scope* s = scope; s; s = s->parent) {
        if (s->kind == ScopeKind::Container) {
            return s->container->is_class ? s->container : nullptr;
        }
    }
    return nullptr;
}

Type Typer::import_prefix_type(ast::ImportNode* import, Scope* scope, std::size_t index) {
    auto cached = prefixes_.find(import);
    if (cached != prefixes_.end()) {
        return cached->second.type;
    }

    std::vector<std::string> head(import->prefix.begin(), import->prefix.end() - 1);
    auto path = make_path(head, import->prefix.back(), import->position.get());
    Type type = check_path(*path, scope, index, false);
    if ((type.kind != TypeKind::Namespace && type.kind != TypeKind::Object) || !type.container) {
        error("import prefix " + import->prefix_text() + " is not a module, class or object", import->position.get());
    }

    PrefixInfo info;
    info.path = std::move(path);
    info.type = type;
    prefixes_[import] = std::move(info);
    return type;
}

Type Typer::member_access(const MemberSymbol* member, ast::Resolution& resolution, bool callee, const ast::PositionData* pos) {
    resolution.member = member;
    resolution.kind = member->owner->is_class ? ast::RefKind::ClassMember : ast::RefKind::ModuleMember;

    Type type = member_type(member, pos);
    if (member->is_callable() && !callee) {
        if (!member->params.empty()) {
            error("missing argument list for def " + member->name, pos);
        }
        resolution.auto_call = true;
    }
    return type;
}

Type Typer::resolve_name(ast::NameNode& node, Scope* scope, std::size_t import_limit, bool callee) {
    const std::string& name = node.name;
    const ast::PositionData* pos = node.position.get();
    bool seen_container = false;

    for (Scope* s = scope; s; s = s->parent) {
        if (s->kind == ScopeKind::Function || s->kind == ScopeKind::Block) {
            auto local = s->locals.find(name);
            if (local != s->locals.end()) {
                node.resolution.kind = ast::RefKind::Local;
                node.resolution.local_id = local->second.id;
                return local->second.type;
            }
        }

        if (s->kind == ScopeKind::Container) {
            const ContainerSymbol* container = s->container;
            bool innermost = !seen_container;
            seen_container = true;

            if (const MemberSymbol* member = container->find(name)) {
                if (member->kind == MemberKind::Container) {
                    node.resolution.kind = ast::RefKind::Container;
                    node.resolution.container = member->nested.get();
                    return Type::namespace_type(member->nested.get());
                }
                if (container->is_class) {
                    if (!innermost) {
                        error(name + " is a member of enclosing class " + container->name +
                              " and cannot be used from a nested module or class", pos);
                    }
                    node.resolution.implicit_this = true;
                }
                return member_access(member, node.resolution, callee, pos);
            }
        }

        std::size_t count = std::min(s == scope ? import_limit : kNoLimit, s->imports.size());

        for (std::size_t i = count; i-- > 0;) {
            ast::ImportNode* import = s->imports[i];
            for (const auto& selector : import->selectors) {
                if (selector.alias != name) continue;
                auto alias = make_path(import->prefix, selector.name, pos);
                Type type = check_path(*alias, s, i, callee);
                node.resolution.alias = std::move(alias);
                return type;
            }
        }

        for (std::size_t i = count; i-- > 0;) {
            ast::ImportNode* import = s->imports[i];
            if (!import->wildcard) continue;
            Type prefix = import_prefix_type(import, s, i);
            if (!prefix.container->find(name)) continue;
            auto alias = make_path(import->prefix, name, pos);
            Type type = check_path(*alias, s, i, callee);
            node.resolution.alias = std::move(alias);
            return type;
        }
    }

    auto pending = pending_.find(name);
    if (pending != pending_.end()) {
        node.resolution.kind = ast::RefKind::Container;
        node.resolution.container = pending->second.get();
        return Type::namespace_type(pending->second.get());
    }
    if (auto global = globals_.find_global(name)) {
        node.resolution.kind = ast::RefKind::Container;
        node.resolution.container = global.get();
        return Type::namespace_type(global.get());
    }

    if (name == "show") {
        if (!callee) {
            error("show must be applied to an argument", pos);
        }
        node.resolution.kind = ast::RefKind::Show;
        return Type::str_type();
    }

    error("not found: " + name, pos);
}

Type Typer::resolve_select(ast::SelectNode& node, Scope* scope, std::size_t import_limit, bool callee) {
    const ast::PositionData* pos = node.position.get();
    Type object = is_path(*node.object) ? check_path(*node.object, scope, import_limit, false)
                                         : check_expr(*node.object, scope);

    if ((object.kind != TypeKind::Namespace && object.kind != TypeKind::Object) || !object.container) {
        error("value of type " + object.to_string() + " has no member " + node.member, pos);
    }

    const ContainerSymbol* container = object.container;
    const MemberSymbol* member = container->find(node.member);
    if (!member) {
        error(node.member + " is not a member of " + object.to_string(), pos);
    }

    if (member->kind == MemberKind::Container) {
        node.resolution.kind = ast::RefKind::Container;
        node.resolution.container = member->nested.get();
        return Type::namespace_type(member->nested.get());
    }

    if (object.kind == TypeKind::Namespace && container->is_class) {
        error(node.member + " is a member of class " + container->name + " and needs an instance", pos);
    }

    return member_access(member, node.resolution, callee, pos);
}

Type Typer::check_path(ast::Expr& path, Scope* scope, std::size_t import_limit, bool callee) {
    Type type;
    if (path.kind == ast::NodeType::Name) {
        type = resolve_name(static_cast<ast::NameNode&>(path), scope, import_limit, callee);
    } else {
        type = resolve_select(static_cast<ast::SelectNode&>(path), scope, import_limit, callee);
    }
    path.type = type;
    return type;
}

const MemberSymbol* Typer::callee_member(const ast::Expr& callee) {
    const ast::Resolution* res = nullptr;
    if (callee.kind == ast::NodeType::Name) {
        res = &static_cast<const ast::NameNode&>(callee).resolution;
        if (res->alias) return callee_member(*res->alias);
    } else if (callee.kind == ast::NodeType::Select) {
        res = &static_cast<const ast::SelectNode&>(callee).resolution;
    }
    if (!res) return nullptr;
    if (res->kind == ast::RefKind::ModuleMember || res->kind == ast::RefKind::ClassMember) {
        return res->member;
    }
    return nullptr;
}

Type Typer::check_value(ast::Expr& expr, Scope* scope) {
    Type type = check_expr(expr, scope);
    if (!type.is_value()) {
        error(type.to_string() + " is not a value", expr.position.get());
    }
    return type;
}

Type Typer::check_expr(ast::Expr& expr, Scope* scope, bool callee) {
    const ast::PositionData* pos = expr.position.get();
    Type type;

    switch (expr.kind) {
        case ast::NodeType::IntLiteral:
            type = Type::int_type();
            break;
        case ast::NodeType::StringLiteral:
            type = Type::str_type();
            break;
        case ast::NodeType::UnitLiteral:
            type = Type::unit_type();
            break;
        case ast::NodeType::Name:
        case ast::NodeType::Select:
            type = check_path(expr, scope, kNoLimit, callee);
            break;
        case ast::NodeType::This: {
            const ContainerSymbol* cls = innermost_class(scope);
            if (!cls) error("'this' can only be used inside a class", pos);
            type = Type::object_type(cls);
            break;
        }
        case ast::NodeType::Call:
            type = check_call(static_cast<ast::CallNode&>(expr), scope);
            break;
        case ast::NodeType::New:
            type = check_new(static_cast<ast::NewNode&>(expr), scope);
            break;
        case ast::NodeType::Binary:
            type = check_binary(static_cast<ast::BinaryNode&>(expr), scope);
            break;
        case ast::NodeType::Unary: {
            auto& unary = static_cast<ast::UnaryNode&>(expr);
            Type operand = check_value(*unary.operand, scope);
            if (operand.kind != TypeKind::Int) {
                error(std::string("operator ") + get_token_name(unary.op) + " expects Int but found " + operand.to_string(), pos);
            }
            type = Type::int_type();
            break;
        }
        case ast::NodeType::If: {
            auto& node = static_cast<ast::IfNode&>(expr);
            Type condition = check_value(*node.condition, scope);
            if (condition.kind != TypeKind::Int) {
                error("condition must be Int but found " + condition.to_string(), node.condition->position.get());
            }
            Type then_type = check_value(*node.then_branch, scope);
            if (node.else_branch) {
                Type else_type = check_value(*node.else_branch, scope);
                if (then_type != else_type) {
                    error("if branches differ: " + then_type.to_string() + " and " + else_type.to_string(), pos);
                }
                type = then_type;
            } else {
                type = Type::unit_type();
            }
            break;
        }
        case ast::NodeType::Block:
            type = check_block(static_cast<ast::BlockNode&>(expr), scope);
            break;
        default:
            error("unsupported expression", pos);
    }

    expr.type = type;
    return type;
}

Type Typer::check_call(ast::CallNode& node, Scope* scope) {
    const ast::PositionData* pos = node.position.get();
    check_expr(*node.callee, scope, true);

    if (node.callee->kind == ast::NodeType::Name) {
        const auto& name = static_cast<const ast::NameNode&>(*node.callee);
        if (name.resolution.kind == ast::RefKind::Show && !name.resolution.alias) {
            if (node.args.size() != 1) {
                error("show takes exactly one argument", pos);
            }
            check_value(*node.args.front(), scope);
            return Type::str_type();
        }
    }

    const MemberSymbol* member = callee_member(*node.callee);
    if (!member || !member->is_callable()) {
        error("expression is not a function and cannot be applied to arguments", pos);
    }

    check_arguments(member->params, node.args, scope, "def " + member->name, pos);
    return member->type;
}

Type Typer::check_new(ast::NewNode& node, Scope* scope) {
    const ast::PositionData* pos = node.position.get();
    Type target = check_path(*node.target, scope, kNoLimit, false);
    if (target.kind != TypeKind::Namespace || !target.container->is_class) {
        error(target.to_string() + " is not a class", pos);
    }

    node.cls = target.container;
    check_arguments(node.cls->ctor_params, node.args, scope, "class " + node.cls->name, pos);
    return Type::object_type(node.cls);
}

void Typer::check_arguments(const std::vector<Param>& params, ast::ExprList& args, Scope* scope, const std::string& what, const ast::PositionData* pos) {
    if (params.size() != args.size()) {
        error(what + " expects " + std::to_string(params.size()) + " argument(s) but got " + std::to_string(args.size()), pos);
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        Type arg = check_value(*args[i], scope);
        if (arg != params[i].type) {
            error("type mismatch for argument " + params[i].name + " of " + what + ": expected " +
                  params[i].type.to_string() + " but found " + arg.to_string(),
                  args[i]->position.get());
        }
    }
}

Type Typer::check_binary(ast::BinaryNode& node, Scope* scope) {
    const ast::PositionData* pos = node.position.get();
    Type left = check_value(*node.left, scope);
    Type right = check_value(*node.right, scope);
    std::string op = get_token_name(node.op);

    switch (node.op) {
        case TokenType::CONCAT:
            if (left.kind != TypeKind::Str) apply_implicit_conversion(node.left, scope);
            if (right.kind != TypeKind::Str) apply_implicit_conversion(node.right, scope);
            return Type::str_type();

        case TokenType::EQUALS:
        case TokenType::DIFFERENT:
            if (left != right) {
                error("cannot compare " + left.to_string() + " with " + right.to_string(), pos);
            }
            return Type::int_type();

        default:
            if (left.kind != TypeKind::Int || right.kind != TypeKind::Int) {
                error("operator " + op + " expects Int operands but found " + left.to_string() + " and " + right.to_string(), pos);
            }
            return Type::int_type();
    }
}

Type Typer::check_block(ast::BlockNode& node, Scope* scope) {
    Scope& block = scopes_.emplace_back();
    block.kind = ScopeKind::Block;
    block.parent = scope;

    Type last = Type::unit_type();
    for (auto& statement : node.statements) {
        if (statement->kind == ast::NodeType::Val) {
            auto& val = static_cast<ast::ValNode&>(*statement);
            Type init = check_value(*val.init, &block);
            if (val.annotation) {
                Type declared = resolve_type(*val.annotation, &block);
                if (declared != init) {
                    error("type mismatch: expected " + declared.to_string() + " but found " + init.to_string(), val.init->position.get());
                }
            }
            if (block.locals.count(val.name)) {
                error(val.name + " is already defined in this block", val.position.get());
            }
            val.local_id = next_local_++;
            block.locals[val.name] = {val.local_id, init};
            last = Type::unit_type();
        } else {
            auto& stmt = static_cast<ast::ExprStatementNode&>(*statement);
            last = check_value(*stmt.expr, &block);
        }
    }
    return last;
}

void Typer::apply_implicit_conversion(std::unique_ptr<ast::Expr>& operand, Scope* scope) {
    Type from = operand->type;
    const ast::PositionData* pos = operand->position.get();

    auto convertible = [&](const MemberSymbol* m) {
        return m && m->implicit && m->kind == MemberKind::Def;
    };

    std::vector<std::pair<std::string, const MemberSymbol*>> candidates;
    for (Scope* s = scope; s; s = s->parent) {
        if (s->kind == ScopeKind::Container) {
            for (const auto& member : s->container->members) {
                if (convertible(member.get())) candidates.emplace_back(member->name, member.get());
            }
        }
        for (std::size_t i = s->imports.size(); i-- > 0;) {
            ast::ImportNode* import = s->imports[i];
            const ContainerSymbol* target = import_prefix_type(import, s, i).container;
            for (const auto& selector : import->selectors) {
                const MemberSymbol* m = target->find(selector.name);
                if (convertible(m)) candidates.emplace_back(selector.alias, m);
            }
            if (import->wildcard) {
                for (const auto& member : target->members) {
                    if (convertible(member.get())) candidates.emplace_back(member->name, member.get());
                }
            }
        }
    }

    for (const auto& [name, target] : candidates) {
        auto callee = std::make_unique<ast::NameNode>(name);
        callee->position = copy_position(pos);
        Type result = check_expr(*callee, scope, true);
        if (callee_member(*callee) != target) continue;
        if (target->params.size() != 1 || target->params[0].type != from || result.kind != TypeKind::Str) continue;

        ast::ExprList args;
        args.push_back(std::move(operand));
        auto call = std::make_unique<ast::CallNode>(std::move(callee), std::move(args));
        call->position = copy_position(pos);
        call->type = Type::str_type();
        operand = std::move(call);
        return;
    }

    error("type mismatch: expected Str but found " + from.to_string() + " and no implicit conversion is in scope", pos);
}

} // namespace kiln::frontend
