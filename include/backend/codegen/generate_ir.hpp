#pragma once

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <memory>
#include <string>
#include <vector>

#include "backend/codegen/ir_context.hpp"
#include "frontend/ast/ast.hpp"

namespace kiln::backend::codegen {

struct GeneratedModule {
    std::string name;
    std::unique_ptr<llvm::Module> module;
};

/**
 * Lowers a typed unit, one LLVM module per top-level container. Nested
 * containers live in their top-level container's module.
 *
 * Module `Q` owns `Q.$state`, `Q.$init` and `Q.$ensure`; its vals are
 * globals `Q.x` read after `Q.$ensure()`. Class `Q` is built by `Q.$new`
 * and its methods take the receiver first.
 */
std::vector<GeneratedModule> generate_program(const frontend::ast::Program& program, llvm::LLVMContext& context);

// A module holding `entry`, a nullary function returning the value of `expr`.
std::unique_ptr<llvm::Module> generate_probe(const frontend::ast::Expr& expr, const std::string& entry, llvm::LLVMContext& context);

void generate_container(const frontend::ast::ContainerNode& node, IRGenerationContext& ctx);

// expressions push exactly one i64 on the evaluation stack
void generate_expr(const frontend::ast::Expr& expr, IRGenerationContext& ctx);
llvm::Value* emit_value(const frontend::ast::Expr& expr, IRGenerationContext& ctx);

} // namespace kiln::backend::codegen
