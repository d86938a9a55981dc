#include "backend/codegen/generate_ir.hpp"

#include <functional>

#include "frontend/checker/symbols.hpp"

namespace kiln::backend::codegen {

using namespace kiln::frontend;

namespace {

// Emits `symbol` with a shadow frame named `frame` around `body`. Parameters
// are passed to `body` in order.
llvm::Function* emit_function(IRGenerationContext& ctx, const std::string& symbol, unsigned arity, const std::string& frame,
                              const std::function<llvm::Value*(const std::vector<llvm::Value*>&)>& body) {
    auto& builder = ctx.get_builder();
    llvm::Function* previous_fn = ctx.get_current_function();
    llvm::Value* previous_this = ctx.get_this();
    llvm::BasicBlock* previous_block = builder.GetInsertBlock();

    llvm::Function* fn = ctx.ensure_function(symbol, arity);
    ctx.set_current_function(fn);
    builder.SetInsertPoint(ctx.create_block("entry"));

    std::vector<llvm::Value*> params;
    for (auto& arg : fn->args()) {
        params.push_back(&arg);
    }

    ctx.call("kiln_rt_enter", {ctx.string_constant(frame)});
    llvm::Value* result = body(params);
    ctx.call("kiln_rt_leave", {});
    builder.CreateRet(result);

    ctx.set_current_function(previous_fn);
    ctx.set_this(previous_this);
    if (previous_block) builder.SetInsertPoint(previous_block);
    return fn;
}

// Nullary function without a shadow frame, for accessors.
llvm::Function* emit_plain_function(IRGenerationContext& ctx, const std::string& symbol, const std::function<llvm::Value*()>& body) {
    auto& builder = ctx.get_builder();
    llvm::Function* previous_fn = ctx.get_current_function();
    llvm::BasicBlock* previous_block = builder.GetInsertBlock();

    llvm::Function* fn = ctx.ensure_function(symbol, 0);
    ctx.set_current_function(fn);
    builder.SetInsertPoint(ctx.create_block("entry"));
    builder.CreateRet(body());

    ctx.set_current_function(previous_fn);
    if (previous_block) builder.SetInsertPoint(previous_block);
    return fn;
}

void generate_module(const ast::ContainerNode& node, IRGenerationContext& ctx) {
    const ContainerSymbol& sym = *node.symbol;
    const std::string& q = sym.qualified;
    auto& builder = ctx.get_builder();

    llvm::GlobalVariable* state = ctx.ensure_global(q + ".$state", true, true);
    for (const auto& child : node.members) {
        if (child->kind != ast::NodeType::Val) continue;
        const auto& val = static_cast<const ast::ValNode&>(*child);
        if (val.is_inline) continue;
        ctx.ensure_global(val.symbol->symbol, true, true);
        if (val.lazy) ctx.ensure_global(val.symbol->symbol + "$done", true, true);
    }

    llvm::Function* init = emit_function(ctx, q + ".$init", 0, q + ".$init", [&](const std::vector<llvm::Value*>&) {
        ctx.set_this(nullptr);
        ctx.clear_locals();
        for (const auto& child : node.members) {
            if (child->kind == ast::NodeType::Val) {
                const auto& val = static_cast<const ast::ValNode&>(*child);
                if (val.lazy || val.is_inline) continue;
                llvm::Value* value = emit_value(*val.init, ctx);
                builder.CreateStore(value, ctx.ensure_global(val.symbol->symbol, true, true));
            } else if (child->kind == ast::NodeType::ExprStatement) {
                emit_value(*static_cast<const ast::ExprStatementNode&>(*child).expr, ctx);
            }
        }
        return ctx.int_constant(0);
    });
    init->setLinkage(llvm::GlobalValue::InternalLinkage);

    emit_plain_function(ctx, q + ".$ensure", [&] {
        return ctx.call("kiln_rt_init_module", {builder.CreatePtrToInt(init, ctx.i64()), builder.CreatePtrToInt(state, ctx.i64())});
    });

    for (const auto& child : node.members) {
        if (child->kind == ast::NodeType::Def) {
            const auto& def = static_cast<const ast::DefNode&>(*child);
            const std::string& symbol = def.symbol->symbol;
            emit_function(ctx, symbol, static_cast<unsigned>(def.params.size()), symbol, [&](const std::vector<llvm::Value*>& params) {
                ctx.set_this(nullptr);
                ctx.clear_locals();
                for (std::size_t i = 0; i < params.size(); ++i) {
                    ctx.bind_local(def.param_ids[i], params[i]);
                }
                return emit_value(*def.body, ctx);
            });
        } else if (child->kind == ast::NodeType::Val) {
            const auto& val = static_cast<const ast::ValNode&>(*child);
            if (val.is_inline) continue;
            const std::string& symbol = val.symbol->symbol;
            if (!val.lazy) {
                emit_plain_function(ctx, symbol + "$get", [&] {
                    ctx.call(q + ".$ensure", {});
                    return builder.CreateLoad(ctx.i64(), ctx.ensure_global(symbol, true, true));
                });
                continue;
            }
            emit_function(ctx, symbol + "$get", 0, symbol, [&](const std::vector<llvm::Value*>&) {
                ctx.set_this(nullptr);
                ctx.clear_locals();
                ctx.call(q + ".$ensure", {});
                llvm::GlobalVariable* storage = ctx.ensure_global(symbol, true, true);
                llvm::GlobalVariable* done = ctx.ensure_global(symbol + "$done", true, true);

                llvm::BasicBlock* compute = ctx.create_block("lazy.compute");
                llvm::BasicBlock* ready = ctx.create_block("lazy.ready");
                builder.CreateCondBr(ctx.as_bool(builder.CreateLoad(ctx.i64(), done)), ready, compute);

                builder.SetInsertPoint(compute);
                llvm::Value* value = emit_value(*val.init, ctx);
                builder.CreateStore(value, storage);
                builder.CreateStore(ctx.int_constant(1), done);
                builder.CreateBr(ready);

                builder.SetInsertPoint(ready);
                return builder.CreateLoad(ctx.i64(), storage);
            });
        } else if (child->kind == ast::NodeType::Container) {
            generate_container(static_cast<const ast::ContainerNode&>(*child), ctx);
        }
    }
}

void generate_class(const ast::ContainerNode& node, IRGenerationContext& ctx) {
    const ContainerSymbol& sym = *node.symbol;
    const std::string& q = sym.qualified;
    auto& builder = ctx.get_builder();

    emit_function(ctx, q + ".$new", static_cast<unsigned>(sym.ctor_params.size()), q + ".$new", [&](const std::vector<llvm::Value*>& params) {
        ctx.clear_locals();
        llvm::Value* object = ctx.call("kiln_rt_alloc", {ctx.int_constant(sym.slot_count), ctx.string_constant(sym.name)});
        ctx.set_this(object);

        for (std::size_t i = 0; i < params.size(); ++i) {
            const MemberSymbol* field = sym.find(sym.ctor_params[i].name);
            builder.CreateStore(params[i], ctx.slot_address(object, field->slot));
        }

        for (const auto& child : node.members) {
            if (child->kind == ast::NodeType::Val) {
                const auto& val = static_cast<const ast::ValNode&>(*child);
                if (val.lazy || val.is_inline) continue;
                llvm::Value* value = emit_value(*val.init, ctx);
                builder.CreateStore(value, ctx.slot_address(object, val.symbol->slot));
            } else if (child->kind == ast::NodeType::ExprStatement) {
                emit_value(*static_cast<const ast::ExprStatementNode&>(*child).expr, ctx);
            }
        }
        return object;
    });

    for (const auto& child : node.members) {
        if (child->kind == ast::NodeType::Def) {
            const auto& def = static_cast<const ast::DefNode&>(*child);
            const std::string& symbol = def.symbol->symbol;
            emit_function(ctx, symbol, static_cast<unsigned>(def.params.size() + 1), symbol, [&](const std::vector<llvm::Value*>& params) {
                ctx.clear_locals();
                ctx.set_this(params[0]);
                for (std::size_t i = 0; i < def.param_ids.size(); ++i) {
                    ctx.bind_local(def.param_ids[i], params[i + 1]);
                }
                return emit_value(*def.body, ctx);
            });
        } else if (child->kind == ast::NodeType::Val) {
            const auto& val = static_cast<const ast::ValNode&>(*child);
            if (!val.lazy) continue;
            const MemberSymbol& field = *val.symbol;
            emit_function(ctx, field.symbol + "$get", 1, field.symbol, [&](const std::vector<llvm::Value*>& params) {
                ctx.clear_locals();
                llvm::Value* object = params[0];
                ctx.set_this(object);

                llvm::BasicBlock* compute = ctx.create_block("lazy.compute");
                llvm::BasicBlock* ready = ctx.create_block("lazy.ready");
                llvm::Value* done = builder.CreateLoad(ctx.i64(), ctx.slot_address(object, field.flag_slot));
                builder.CreateCondBr(ctx.as_bool(done), ready, compute);

                builder.SetInsertPoint(compute);
                llvm::Value* value = emit_value(*val.init, ctx);
                builder.CreateStore(value, ctx.slot_address(object, field.slot));
                builder.CreateStore(ctx.int_constant(1), ctx.slot_address(object, field.flag_slot));
                builder.CreateBr(ready);

                builder.SetInsertPoint(ready);
                return builder.CreateLoad(ctx.i64(), ctx.slot_address(object, field.slot));
            });
        } else if (child->kind == ast::NodeType::Container) {
            generate_container(static_cast<const ast::ContainerNode&>(*child), ctx);
        }
    }
}

} // namespace

void generate_container(const ast::ContainerNode& node, IRGenerationContext& ctx) {
    if (node.container_kind == ast::ContainerKind::Class) {
        generate_class(node, ctx);
    } else {
        generate_module(node, ctx);
    }
}

std::vector<GeneratedModule> generate_program(const ast::Program& program, llvm::LLVMContext& context) {
    std::vector<GeneratedModule> out;
    for (const auto& item : program.items) {
        auto module = std::make_unique<llvm::Module>(item->name, context);
        llvm::IRBuilder<llvm::NoFolder> builder(context);
        IRGenerationContext ctx(context, *module, builder);
        generate_container(*item, ctx);
        out.push_back({item->name, std::move(module)});
    }
    return out;
}

std::unique_ptr<llvm::Module> generate_probe(const ast::Expr& expr, const std::string& entry, llvm::LLVMContext& context) {
    auto module = std::make_unique<llvm::Module>(entry, context);
    llvm::IRBuilder<llvm::NoFolder> builder(context);
    IRGenerationContext ctx(context, *module, builder);

    llvm::Function* fn = ctx.ensure_function(entry, 0);
    ctx.set_current_function(fn);
    builder.SetInsertPoint(ctx.create_block("entry"));
    builder.CreateRet(emit_value(expr, ctx));
    return module;
}

} // namespace kiln::backend::codegen
