#include "frontend/checker/typer.hpp"

namespace kiln::frontend {

namespace {

std::string describe(const ContainerSymbol& c) {
    return (c.is_class ? "class " : "module ") + c.name;
}

std::string member_word(MemberKind kind) {
    switch (kind) {
        case MemberKind::Def:
        case MemberKind::Extern:
            return "def";
        case MemberKind::Container:
            return "container";
        default:
            return "val";
    }
}

} // namespace

Typer::Typer(const SymbolTable& globals, InlineEvaluator evaluate_inline, ExternChecker check_extern)
    : globals_(globals), evaluate_inline_(std::move(evaluate_inline)), check_extern_(std::move(check_extern)) {}

void Typer::error(const std::string& message, const ast::PositionData* pos) {
    throw CompileError(message, pos ? pos->line : 0, pos ? pos->col[0] : 0);
}

std::vector<std::shared_ptr<ContainerSymbol>> Typer::check(ast::Program& program) {
    scopes_.clear();
    pending_.clear();
    decls_.clear();
    prefixes_.clear();
    container_scopes_.clear();
    exported_class_ = nullptr;
    next_local_ = 0;

    Scope& unit = scopes_.emplace_back();
    unit.kind = ScopeKind::Unit;
    for (auto& import : program.imports) {
        unit.imports.push_back(import.get());
    }

    std::vector<std::shared_ptr<ContainerSymbol>> containers;
    for (auto& item : program.items) {
        if (pending_.count(item->name)) {
            error(item->name + " is already defined in this unit", item->position.get());
        }
        auto symbol = declare_container(*item, &unit, nullptr, item->name);
        pending_[item->name] = symbol;
        containers.push_back(symbol);
        if (item->exported && symbol->is_class) {
            exported_class_ = symbol.get();
        }
    }

    for (auto& item : program.items) {
        resolve_ctor_params(*item);
    }

    for (std::size_t i = 0; i < program.imports.size(); ++i) {
        check_import(*program.imports[i], &unit, i);
    }

    for (auto& item : program.items) {
        check_container(*item);
    }

    return containers;
}

std::shared_ptr<ContainerSymbol> Typer::declare_container(ast::ContainerNode& node, Scope* parent, const ContainerSymbol* owner, const std::string& artifact) {
    auto symbol = std::make_shared<ContainerSymbol>();
    symbol->is_class = node.container_kind == ast::ContainerKind::Class;
    symbol->name = node.name;
    symbol->owner = owner;
    symbol->qualified = owner ? owner->qualified + "." + node.name : node.name;
    symbol->artifact = artifact;
    node.symbol = symbol.get();

    Scope& scope = scopes_.emplace_back();
    scope.kind = ScopeKind::Container;
    scope.parent = parent;
    scope.container = symbol.get();
    container_scopes_[&node] = &scope;

    auto add_member = [&](std::shared_ptr<MemberSymbol> member, ast::Node* decl_node) -> MemberSymbol* {
        if (symbol->find(member->name)) {
            error(member->name + " is already defined in " + describe(*symbol), decl_node->position.get());
        }
        MemberSymbol* added = symbol->add(std::move(member));
        if (added->kind != MemberKind::Container && !added->is_param) {
            MemberDecl decl;
            decl.symbol = added;
            decl.node = decl_node;
            decl.scope = &scope;
            decls_[added] = decl;
        }
        return added;
    };

    for (const auto& param : node.ctor_params) {
        auto member = std::make_shared<MemberSymbol>();
        member->name = param.name;
        member->kind = MemberKind::Val;
        member->is_param = true;
        member->slot = symbol->slot_count++;
        member->symbol = symbol->qualified + "." + param.name;
        add_member(std::move(member), &node);
    }

    for (auto& child : node.members) {
        switch (child->kind) {
            case ast::NodeType::Import:
                scope.imports.push_back(static_cast<ast::ImportNode*>(child.get()));
                break;

            case ast::NodeType::Val: {
                auto* val = static_cast<ast::ValNode*>(child.get());
                auto member = std::make_shared<MemberSymbol>();
                member->name = val->name;
                member->kind = val->lazy ? MemberKind::LazyVal : val->is_inline ? MemberKind::InlineVal : MemberKind::Val;
                member->implicit = val->implicit;
                member->symbol = symbol->qualified + "." + val->name;
                if (symbol->is_class && !val->is_inline) {
                    member->slot = symbol->slot_count++;
                    if (val->lazy) member->flag_slot = symbol->slot_count++;
                }
                val->symbol = add_member(std::move(member), val);
                break;
            }

            case ast::NodeType::Def: {
                auto* def = static_cast<ast::DefNode*>(child.get());
                auto member = std::make_shared<MemberSymbol>();
                member->name = def->name;
                member->kind = MemberKind::Def;
                member->implicit = def->implicit;
                member->has_parens = def->has_parens;
                member->symbol = symbol->qualified + "." + def->name;
                def->symbol = add_member(std::move(member), def);
                break;
            }

            case ast::NodeType::Extern: {
                auto* ext = static_cast<ast::ExternNode*>(child.get());
                auto member = std::make_shared<MemberSymbol>();
                member->name = ext->name;
                member->kind = MemberKind::Extern;
                member->symbol = ext->name;
                ext->symbol = add_member(std::move(member), ext);
                break;
            }

            case ast::NodeType::Container: {
                auto* nested = static_cast<ast::ContainerNode*>(child.get());
                auto member = std::make_shared<MemberSymbol>();
                member->name = nested->name;
                member->kind = MemberKind::Container;
                member->nested = declare_container(*nested, &scope, symbol.get(), artifact);
                add_member(std::move(member), nested);
                break;
            }

            default:
                break;
        }
    }

    return symbol;
}

void Typer::resolve_ctor_params(ast::ContainerNode& node) {
    ContainerSymbol* symbol = node.symbol;
    Scope* scope = container_scopes_.at(&node);

    for (const auto& param : node.ctor_params) {
        Type type = resolve_type(param.type, scope->parent);
        auto it = symbol->index.find(param.name);
        symbol->members[it->second]->type = type;
        symbol->ctor_params.push_back({param.name, type});
    }

    for (auto& child : node.members) {
        if (child->kind == ast::NodeType::Container) {
            resolve_ctor_params(*static_cast<ast::ContainerNode*>(child.get()));
        }
    }
}

void Typer::check_container(ast::ContainerNode& node) {
    Scope* scope = container_scopes_.at(&node);
    std::size_t import_index = 0;

    for (auto& child : node.members) {
        switch (child->kind) {
            case ast::NodeType::Import:
                check_import(*static_cast<ast::ImportNode*>(child.get()), scope, import_index++);
                break;
            case ast::NodeType::Val:
                check_member(static_cast<ast::ValNode*>(child.get())->symbol);
                break;
            case ast::NodeType::Def:
                check_member(static_cast<ast::DefNode*>(child.get())->symbol);
                break;
            case ast::NodeType::Extern:
                check_member(static_cast<ast::ExternNode*>(child.get())->symbol);
                break;
            case ast::NodeType::Container:
                check_container(*static_cast<ast::ContainerNode*>(child.get()));
                break;
            case ast::NodeType::ExprStatement:
                check_value(*static_cast<ast::ExprStatementNode*>(child.get())->expr, scope);
                break;
            default:
                break;
        }
    }
}

void Typer::check_member(const MemberSymbol* member) {
    auto it = decls_.find(member);
    if (it == decls_.end()) return;

    MemberDecl& decl = it->second;
    if (decl.state == CheckState::Done) return;
    if (decl.state == CheckState::Checking) {
        error("recursive " + member_word(member->kind) + " " + member->name + " needs an explicit type", decl.node->position.get());
    }

    decl.state = CheckState::Checking;
    switch (decl.node->kind) {
        case ast::NodeType::Val:
            check_val(*static_cast<ast::ValNode*>(decl.node), decl);
            break;
        case ast::NodeType::Def:
            check_def(*static_cast<ast::DefNode*>(decl.node), decl);
            break;
        case ast::NodeType::Extern:
            check_extern(*static_cast<ast::ExternNode*>(decl.node), decl);
            break;
        default:
            break;
    }
    decl.state = CheckState::Done;
    decl.typed = true;
}

Type Typer::member_type(const MemberSymbol* member, const ast::PositionData* use) {
    auto it = decls_.find(member);
    if (it == decls_.end() || it->second.typed) {
        return member->type;
    }
    if (it->second.state == CheckState::Checking) {
        error("recursive " + member_word(member->kind) + " " + member->name + " needs an explicit type", use);
    }
    check_member(member);
    return member->type;
}

void Typer::check_val(ast::ValNode& node, MemberDecl& decl) {
    MemberSymbol& member = *decl.symbol;

    if (node.annotation) {
        member.type = resolve_type(*node.annotation, decl.scope);
        decl.typed = true;
    }

    Type init = check_value(*node.init, decl.scope);
    if (node.annotation) {
        if (init != member.type) {
            error("type mismatch: expected " + member.type.to_string() + " but found " + init.to_string(), node.init->position.get());
        }
    } else {
        member.type = init;
    }

    if (!node.is_inline) return;

    if (member.type.kind != TypeKind::Int) {
        error("inline val " + node.name + " must have type Int", node.position.get());
    }

    std::string reason = "compile-time evaluation is not available";
    std::optional<std::int64_t> value;
    if (evaluate_inline_) {
        reason.clear();
        value = evaluate_inline_(*node.init, reason);
    }
    if (!value) {
        error("inline val " + node.name + " could not be evaluated at compile time: " + reason, node.position.get());
    }
    member.constant = *value;
}

void Typer::check_def(ast::DefNode& node, MemberDecl& decl) {
    MemberSymbol& member = *decl.symbol;

    Scope& fn = scopes_.emplace_back();
    fn.kind = ScopeKind::Function;
    fn.parent = decl.scope;

    member.params.clear();
    node.param_ids.clear();
    for (const auto& param : node.params) {
        if (fn.locals.count(param.name)) {
            error("duplicate parameter " + param.name + " in def " + node.name, param.type.position.get());
        }
        Type type = resolve_type(param.type, decl.scope);
        int id = next_local_++;
        fn.locals[param.name] = {id, type};
        member.params.push_back({param.name, type});
        node.param_ids.push_back(id);
    }

    if (node.result) {
        member.type = resolve_type(*node.result, decl.scope);
        decl.typed = true;
    }

    Type body = check_value(*node.body, &fn);
    if (node.result) {
        if (body != member.type) {
            error("type mismatch: def " + node.name + " declares " + member.type.to_string() + " but its body is " + body.to_string(),
                  node.body->position.get());
        }
    } else {
        member.type = body;
    }
}

void Typer::check_extern(ast::ExternNode& node, MemberDecl& decl) {
    MemberSymbol& member = *decl.symbol;

    member.params.clear();
    for (const auto& param : node.params) {
        member.params.push_back({param.name, resolve_type(param.type, decl.scope)});
    }
    member.type = resolve_type(node.result, decl.scope);
    decl.typed = true;

    if (check_extern_ && !check_extern_(node.name)) {
        error("extern symbol " + node.name + " not found on the runtime classpath", node.position.get());
    }
}

void Typer::check_import(ast::ImportNode& node, Scope* scope, std::size_t index) {
    Type prefix = import_prefix_type(&node, scope, index);
    const ContainerSymbol* target = prefix.container;

    for (auto& selector : node.selectors) {
        const MemberSymbol* member = target->find(selector.name);
        if (!member) {
            error(selector.name + " is not a member of " + node.prefix_text(), node.position.get());
        }
        selector.implicit = member->implicit;
    }

    ResolvedPath resolved = path_text(*prefixes_.at(&node).path);
    node.resolved_prefix = resolved.text;
    node.relative_prefix = resolved.relative;
}

Type Typer::resolve_type(const ast::TypeRef& ref, Scope* scope) {
    if (ref.path.size() == 1) {
        const std::string& name = ref.path.front();
        if (name == "Int") return Type::int_type();
        if (name == "Str") return Type::str_type();
        if (name == "Unit") return Type::unit_type();
    }

    std::vector<std::string> head(ref.path.begin(), ref.path.end() - 1);
    auto path = make_path(head, ref.path.back(), ref.position.get());
    Type type = check_path(*path, scope, kNoLimit, false);
    if (type.kind == TypeKind::Namespace && type.container->is_class) {
        return Type::object_type(type.container);
    }
    error("not a type: " + ref.to_string(), ref.position.get());
}

Typer::ResolvedPath Typer::path_text(const ast::Expr& path) const {
    if (path.kind == ast::NodeType::Select) {
        const auto& select = static_cast<const ast::SelectNode&>(path);
        ResolvedPath base = path_text(*select.object);
        base.text += "." + select.member;
        return base;
    }

    const auto& name = static_cast<const ast::NameNode&>(path);
    const ast::Resolution& res = name.resolution;
    if (res.alias) {
        return path_text(*res.alias);
    }

    switch (res.kind) {
        case ast::RefKind::ModuleMember:
            return {res.member->owner->qualified + "." + name.name, false};
        case ast::RefKind::ClassMember:
            return {name.name, res.implicit_this && res.member->owner == exported_class_};
        case ast::RefKind::Container:
            return {res.container->qualified, false};
        default:
            return {name.name, false};
    }
}

} // namespace kiln::frontend
