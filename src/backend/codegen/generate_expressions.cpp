#include "backend/codegen/generate_ir.hpp"

#include "frontend/checker/symbols.hpp"
#include "frontend/compile_error.hpp"

namespace kiln::backend::codegen {

using namespace kiln::frontend;

namespace {

CompileError codegen_error(const std::string& message, const ast::Expr& at) {
    const ast::PositionData* pos = at.position.get();
    return CompileError(message, pos ? pos->line : 0, pos ? pos->col[0] : 0);
}

llvm::Value* receiver_this(IRGenerationContext& ctx, const ast::Expr& at) {
    llvm::Value* self = ctx.get_this();
    if (!self) {
        throw codegen_error("class members need an instance here", at);
    }
    return self;
}

// Value of a member read without an argument list.
llvm::Value* member_value(const MemberSymbol& member, llvm::Value* receiver, IRGenerationContext& ctx) {
    auto& builder = ctx.get_builder();
    bool in_class = member.owner->is_class;

    switch (member.kind) {
        case MemberKind::InlineVal:
            return ctx.int_constant(member.constant);
        case MemberKind::Val:
            if (in_class) {
                return builder.CreateLoad(ctx.i64(), ctx.slot_address(receiver, member.slot));
            }
            return ctx.call(member.symbol + "$get", {});
        case MemberKind::LazyVal:
            if (in_class) {
                return ctx.call(member.symbol + "$get", {receiver});
            }
            return ctx.call(member.symbol + "$get", {});
        case MemberKind::Def:
            if (in_class) {
                return ctx.call(member.symbol, {receiver});
            }
            return ctx.call(member.symbol, {});
        case MemberKind::Extern:
            return ctx.call(member.symbol, {});
        case MemberKind::Container:
            break;
    }
    return ctx.int_constant(0);
}

void generate_name(const ast::NameNode& node, IRGenerationContext& ctx) {
    const ast::Resolution& res = node.resolution;
    if (res.alias) {
        generate_expr(*res.alias, ctx);
        return;
    }

    switch (res.kind) {
        case ast::RefKind::Local:
            ctx.push_value(ctx.lookup_local(res.local_id));
            return;
        case ast::RefKind::ModuleMember:
            ctx.push_value(member_value(*res.member, nullptr, ctx));
            return;
        case ast::RefKind::ClassMember:
            ctx.push_value(member_value(*res.member, receiver_this(ctx, node), ctx));
            return;
        default:
            // namespaces have no runtime value
            ctx.push_value(ctx.int_constant(0));
            return;
    }
}

void generate_select(const ast::SelectNode& node, IRGenerationContext& ctx) {
    const ast::Resolution& res = node.resolution;
    switch (res.kind) {
        case ast::RefKind::ModuleMember:
            ctx.push_value(member_value(*res.member, nullptr, ctx));
            return;
        case ast::RefKind::ClassMember: {
            llvm::Value* object = emit_value(*node.object, ctx);
            ctx.push_value(member_value(*res.member, object, ctx));
            return;
        }
        default:
            ctx.push_value(ctx.int_constant(0));
            return;
    }
}

void generate_show(const ast::Expr& arg, IRGenerationContext& ctx) {
    llvm::Value* value = emit_value(arg, ctx);
    switch (arg.type.kind) {
        case TypeKind::Int:
            ctx.push_value(ctx.call("kiln_rt_show_int", {value}));
            return;
        case TypeKind::Str:
            ctx.push_value(ctx.call("kiln_rt_show_str", {value}));
            return;
        case TypeKind::Object:
            ctx.push_value(ctx.call("kiln_rt_show_obj", {value}));
            return;
        default:
            ctx.push_value(ctx.string_constant("()"));
            return;
    }
}

void generate_call(const ast::CallNode& node, IRGenerationContext& ctx) {
    const ast::Expr* callee = node.callee.get();
    while (callee->kind == ast::NodeType::Name && static_cast<const ast::NameNode*>(callee)->resolution.alias) {
        callee = static_cast<const ast::NameNode*>(callee)->resolution.alias.get();
    }

    const ast::Resolution* res = nullptr;
    llvm::Value* receiver = nullptr;
    if (callee->kind == ast::NodeType::Name) {
        res = &static_cast<const ast::NameNode*>(callee)->resolution;
        if (res->kind == ast::RefKind::Show) {
            generate_show(*node.args.front(), ctx);
            return;
        }
        if (res->kind == ast::RefKind::ClassMember) {
            receiver = receiver_this(ctx, *callee);
        }
    } else {
        const auto* select = static_cast<const ast::SelectNode*>(callee);
        res = &select->resolution;
        if (res->kind == ast::RefKind::ClassMember) {
            receiver = emit_value(*select->object, ctx);
        }
    }

    const MemberSymbol& member = *res->member;
    std::vector<llvm::Value*> args;
    if (member.kind == MemberKind::Def && member.owner->is_class) {
        args.push_back(receiver);
    }
    for (const auto& arg : node.args) {
        args.push_back(emit_value(*arg, ctx));
    }
    ctx.push_value(ctx.call(member.symbol, args));
}

void generate_logical(const ast::BinaryNode& node, IRGenerationContext& ctx) {
    auto& builder = ctx.get_builder();
    bool is_and = node.op == TokenType::AND;

    llvm::Value* lhs = ctx.as_bool(emit_value(*node.left, ctx));
    llvm::BasicBlock* lhs_end = builder.GetInsertBlock();
    llvm::BasicBlock* rhs_block = ctx.create_block(is_and ? "and.rhs" : "or.rhs");
    llvm::BasicBlock* end_block = ctx.create_block(is_and ? "and.end" : "or.end");
    if (is_and) {
        builder.CreateCondBr(lhs, rhs_block, end_block);
    } else {
        builder.CreateCondBr(lhs, end_block, rhs_block);
    }

    builder.SetInsertPoint(rhs_block);
    llvm::Value* rhs = ctx.from_bool(ctx.as_bool(emit_value(*node.right, ctx)));
    llvm::BasicBlock* rhs_end = builder.GetInsertBlock();
    builder.CreateBr(end_block);

    builder.SetInsertPoint(end_block);
    llvm::PHINode* phi = builder.CreatePHI(ctx.i64(), 2);
    phi->addIncoming(ctx.int_constant(is_and ? 0 : 1), lhs_end);
    phi->addIncoming(rhs, rhs_end);
    ctx.push_value(phi);
}

void generate_binary(const ast::BinaryNode& node, IRGenerationContext& ctx) {
    if (node.op == TokenType::AND || node.op == TokenType::OR) {
        generate_logical(node, ctx);
        return;
    }

    auto& builder = ctx.get_builder();
    llvm::Value* lhs = emit_value(*node.left, ctx);
    llvm::Value* rhs = emit_value(*node.right, ctx);
    bool strings = node.left->type.kind == TypeKind::Str;

    switch (node.op) {
        case TokenType::PLUS: ctx.push_value(builder.CreateAdd(lhs, rhs)); return;
        case TokenType::MINUS: ctx.push_value(builder.CreateSub(lhs, rhs)); return;
        case TokenType::MUL: ctx.push_value(builder.CreateMul(lhs, rhs)); return;
        case TokenType::DIV: ctx.push_value(ctx.call("kiln_rt_div", {lhs, rhs})); return;
        case TokenType::MOD: ctx.push_value(ctx.call("kiln_rt_mod", {lhs, rhs})); return;
        case TokenType::CONCAT: ctx.push_value(ctx.call("kiln_rt_concat", {lhs, rhs})); return;
        case TokenType::LT: ctx.push_value(ctx.from_bool(builder.CreateICmpSLT(lhs, rhs))); return;
        case TokenType::GT: ctx.push_value(ctx.from_bool(builder.CreateICmpSGT(lhs, rhs))); return;
        case TokenType::LESS_THAN_EQUALS: ctx.push_value(ctx.from_bool(builder.CreateICmpSLE(lhs, rhs))); return;
        case TokenType::GREATER_THAN_EQUALS: ctx.push_value(ctx.from_bool(builder.CreateICmpSGE(lhs, rhs))); return;
        case TokenType::EQUALS:
            if (strings) {
                ctx.push_value(ctx.call("kiln_rt_str_eq", {lhs, rhs}));
            } else {
                ctx.push_value(ctx.from_bool(builder.CreateICmpEQ(lhs, rhs)));
            }
            return;
        case TokenType::DIFFERENT:
            if (strings) {
                ctx.push_value(builder.CreateXor(ctx.call("kiln_rt_str_eq", {lhs, rhs}), ctx.int_constant(1)));
            } else {
                ctx.push_value(ctx.from_bool(builder.CreateICmpNE(lhs, rhs)));
            }
            return;
        default:
            throw codegen_error(std::string("unsupported operator ") + get_token_name(node.op), node);
    }
}

void generate_if(const ast::IfNode& node, IRGenerationContext& ctx) {
    auto& builder = ctx.get_builder();
    llvm::Value* condition = ctx.as_bool(emit_value(*node.condition, ctx));

    llvm::BasicBlock* then_block = ctx.create_block("if.then");
    llvm::BasicBlock* else_block = ctx.create_block("if.else");
    llvm::BasicBlock* merge_block = ctx.create_block("if.end");
    builder.CreateCondBr(condition, then_block, else_block);

    builder.SetInsertPoint(then_block);
    llvm::Value* then_value = emit_value(*node.then_branch, ctx);
    llvm::BasicBlock* then_end = builder.GetInsertBlock();
    builder.CreateBr(merge_block);

    builder.SetInsertPoint(else_block);
    llvm::Value* else_value = node.else_branch ? emit_value(*node.else_branch, ctx) : ctx.int_constant(0);
    llvm::BasicBlock* else_end = builder.GetInsertBlock();
    builder.CreateBr(merge_block);

    builder.SetInsertPoint(merge_block);
    if (!node.else_branch) {
        ctx.push_value(ctx.int_constant(0));
        return;
    }
    llvm::PHINode* phi = builder.CreatePHI(ctx.i64(), 2);
    phi->addIncoming(then_value, then_end);
    phi->addIncoming(else_value, else_end);
    ctx.push_value(phi);
}

void generate_block(const ast::BlockNode& node, IRGenerationContext& ctx) {
    llvm::Value* last = ctx.int_constant(0);
    for (const auto& statement : node.statements) {
        if (statement->kind == ast::NodeType::Val) {
            const auto& val = static_cast<const ast::ValNode&>(*statement);
            ctx.bind_local(val.local_id, emit_value(*val.init, ctx));
            last = ctx.int_constant(0);
        } else {
            last = emit_value(*static_cast<const ast::ExprStatementNode&>(*statement).expr, ctx);
        }
    }
    ctx.push_value(last);
}

} // namespace

llvm::Value* emit_value(const ast::Expr& expr, IRGenerationContext& ctx) {
    generate_expr(expr, ctx);
    return ctx.pop_value();
}

void generate_expr(const ast::Expr& expr, IRGenerationContext& ctx) {
    auto& builder = ctx.get_builder();

    switch (expr.kind) {
        case ast::NodeType::IntLiteral:
            ctx.push_value(ctx.int_constant(static_cast<const ast::IntLiteralNode&>(expr).value));
            return;
        case ast::NodeType::StringLiteral:
            ctx.push_value(ctx.string_constant(static_cast<const ast::StringLiteralNode&>(expr).value));
            return;
        case ast::NodeType::UnitLiteral:
            ctx.push_value(ctx.int_constant(0));
            return;
        case ast::NodeType::Name:
            generate_name(static_cast<const ast::NameNode&>(expr), ctx);
            return;
        case ast::NodeType::Select:
            generate_select(static_cast<const ast::SelectNode&>(expr), ctx);
            return;
        case ast::NodeType::This:
            ctx.push_value(receiver_this(ctx, expr));
            return;
        case ast::NodeType::Call:
            generate_call(static_cast<const ast::CallNode&>(expr), ctx);
            return;
        case ast::NodeType::New: {
            const auto& node = static_cast<const ast::NewNode&>(expr);
            std::vector<llvm::Value*> args;
            for (const auto& arg : node.args) {
                args.push_back(emit_value(*arg, ctx));
            }
            ctx.push_value(ctx.call(node.cls->qualified + ".$new", args));
            return;
        }
        case ast::NodeType::Binary:
            generate_binary(static_cast<const ast::BinaryNode&>(expr), ctx);
            return;
        case ast::NodeType::Unary: {
            const auto& node = static_cast<const ast::UnaryNode&>(expr);
            llvm::Value* operand = emit_value(*node.operand, ctx);
            if (node.op == TokenType::MINUS) {
                ctx.push_value(builder.CreateSub(ctx.int_constant(0), operand));
            } else {
                ctx.push_value(ctx.from_bool(builder.CreateICmpEQ(operand, ctx.int_constant(0))));
            }
            return;
        }
        case ast::NodeType::If:
            generate_if(static_cast<const ast::IfNode&>(expr), ctx);
            return;
        case ast::NodeType::Block:
            generate_block(static_cast<const ast::BlockNode&>(expr), ctx);
            return;
        default:
            throw codegen_error("expression cannot be lowered", expr);
    }
}

} // namespace kiln::backend::codegen
