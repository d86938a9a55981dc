#include "backend/codegen/ir_context.hpp"

#include <stdexcept>

namespace kiln::backend::codegen {

llvm::Value* IRGenerationContext::lookup_local(int id) const {
    auto it = locals.find(id);
    if (it == locals.end()) {
        throw std::logic_error("codegen: local #" + std::to_string(id) + " is not bound");
    }
    return it->second;
}

llvm::Value* IRGenerationContext::pop_value() {
    if (eval_stack.empty()) {
        throw std::logic_error("codegen: evaluation stack underflow");
    }
    llvm::Value* v = eval_stack.back();
    eval_stack.pop_back();
    return v;
}

llvm::ConstantInt* IRGenerationContext::int_constant(std::int64_t value) {
    return llvm::ConstantInt::get(i64(), static_cast<std::uint64_t>(value), true);
}

llvm::FunctionType* IRGenerationContext::function_type(unsigned arity) {
    std::vector<llvm::Type*> params(arity, i64());
    return llvm::FunctionType::get(i64(), params, false);
}

llvm::Function* IRGenerationContext::ensure_function(const std::string& symbol, unsigned arity) {
    if (llvm::Function* existing = module.getFunction(symbol)) {
        return existing;
    }
    return llvm::Function::Create(function_type(arity), llvm::Function::ExternalLinkage, symbol, module);
}

llvm::GlobalVariable* IRGenerationContext::ensure_global(const std::string& symbol, bool define, bool internal) {
    llvm::GlobalVariable* gv = module.getGlobalVariable(symbol, true);
    if (!gv) {
        gv = new llvm::GlobalVariable(module, i64(), false, llvm::GlobalValue::ExternalLinkage, nullptr, symbol);
    }
    if (define && !gv->hasInitializer()) {
        gv->setInitializer(int_constant(0));
        if (internal) gv->setLinkage(llvm::GlobalValue::InternalLinkage);
    }
    return gv;
}

llvm::Value* IRGenerationContext::string_constant(const std::string& text) {
    llvm::Value* ptr = builder.CreateGlobalStringPtr(text, "str");
    return builder.CreatePtrToInt(ptr, i64());
}

llvm::Value* IRGenerationContext::call(const std::string& symbol, const std::vector<llvm::Value*>& args) {
    llvm::Function* fn = ensure_function(symbol, static_cast<unsigned>(args.size()));
    return builder.CreateCall(fn, args);
}

llvm::Value* IRGenerationContext::slot_address(llvm::Value* object, int index) {
    llvm::Value* base = builder.CreateIntToPtr(object, llvm::PointerType::getUnqual(i64()));
    return builder.CreateGEP(i64(), base, int_constant(index));
}

llvm::Value* IRGenerationContext::as_bool(llvm::Value* value) {
    return builder.CreateICmpNE(value, int_constant(0));
}

llvm::Value* IRGenerationContext::from_bool(llvm::Value* flag) {
    return builder.CreateZExt(flag, i64());
}

} // namespace kiln::backend::codegen
