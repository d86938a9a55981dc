#pragma once

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/NoFolder.h>
#include <llvm/IR/Value.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln::backend::codegen {

/**
 * IRGenerationContext
 *
 * Holds the module and builder for one artifact plus the state of the
 * function being emitted: bound locals, the receiver of class code and the
 * evaluation stack expressions push their results on.
 *
 * Every value is an i64. Strings and objects travel as addresses, Unit as 0.
 */
class IRGenerationContext {
private:
    llvm::LLVMContext& llvm_context;
    llvm::Module& module;
    llvm::IRBuilder<llvm::NoFolder>& builder;

    llvm::Function* current_function = nullptr;
    llvm::Value* this_value = nullptr;
    std::unordered_map<int, llvm::Value*> locals;
    std::vector<llvm::Value*> eval_stack;

public:
    IRGenerationContext(llvm::LLVMContext& ctx, llvm::Module& mod, llvm::IRBuilder<llvm::NoFolder>& bld)
        : llvm_context(ctx), module(mod), builder(bld) {}

    llvm::LLVMContext& get_context() { return llvm_context; }
    llvm::Module& get_module() { return module; }
    llvm::IRBuilder<llvm::NoFolder>& get_builder() { return builder; }

    void set_current_function(llvm::Function* fn) { current_function = fn; }
    llvm::Function* get_current_function() { return current_function; }

    // receiver of the class code being emitted, null in module code
    void set_this(llvm::Value* value) { this_value = value; }
    llvm::Value* get_this() const { return this_value; }

    void bind_local(int id, llvm::Value* value) { locals[id] = value; }
    llvm::Value* lookup_local(int id) const;
    void clear_locals() { locals.clear(); }

    void push_value(llvm::Value* v) { eval_stack.push_back(v); }
    llvm::Value* pop_value();

    llvm::IntegerType* i64() { return llvm::Type::getInt64Ty(llvm_context); }
    llvm::ConstantInt* int_constant(std::int64_t value);

    // i64(i64, ...) with `arity` parameters
    llvm::FunctionType* function_type(unsigned arity);

    // Declares (or finds) a function of this artifact or of another one.
    llvm::Function* ensure_function(const std::string& symbol, unsigned arity);

    // Runtime entry points are all i64(i64, ...).
    llvm::Function* ensure_runtime_func(const std::string& name, unsigned arity) { return ensure_function(name, arity); }

    // i64 global, defined here when `define` is set, otherwise an external declaration
    llvm::GlobalVariable* ensure_global(const std::string& symbol, bool define, bool internal = false);

    // address of a private, NUL-terminated copy of `text`
    llvm::Value* string_constant(const std::string& text);

    llvm::Value* call(const std::string& symbol, const std::vector<llvm::Value*>& args);

    // pointer to slot `index` of the object at address `object`
    llvm::Value* slot_address(llvm::Value* object, int index);

    llvm::Value* as_bool(llvm::Value* value);
    llvm::Value* from_bool(llvm::Value* flag);

    llvm::BasicBlock* create_block(const std::string& name) {
        return llvm::BasicBlock::Create(llvm_context, name, current_function);
    }
};

} // namespace kiln::backend::codegen
