#include "backend/registry/loader.hpp"

#include <cstdint>
#include <optional>

#include <llvm/ExecutionEngine/Orc/Core.h>

#include "backend/registry/generation.hpp"

namespace kiln::backend::registry {

namespace {

llvm::Error make_error_text(const std::string& message) {
    return llvm::make_error<llvm::StringError>(message, llvm::inconvertibleErrorCode());
}

std::string describe(runtime::FaultPtr fault) {
    while (fault->cause) {
        fault = fault->cause;
    }
    return fault->message.empty() ? fault->type : fault->type + ": " + fault->message;
}

class EntryPoint : public Loadable {
public:
    EntryPoint(std::shared_ptr<GenerationState> generation, std::string name, std::int64_t (*fn)())
        : generation_(std::move(generation)), name_(std::move(name)), fn_(fn) {}

    const std::string& name() const override { return name_; }

    InvokeOutcome invoke_entry() override {
        InvokeOutcome out;
        if (generation_->retired) {
            out.fault = runtime::make_fault(runtime::fault_types::kRuntimeError,
                name_ + " belongs to retired loader generation " + std::to_string(generation_->id));
            return out;
        }
        runtime::RuntimeContext* ctx = runtime::current_context();
        if (!ctx) {
            out.fault = runtime::make_fault(runtime::fault_types::kRuntimeError, "no runtime context is active");
            return out;
        }

        runtime::CallOutcome call = ctx->call_guarded(fn_, runtime::kHostFrame);
        if (call.fault) {
            out.fault = runtime::make_fault(runtime::fault_types::kInvocationError, "", {}, call.fault);
            return out;
        }
        const char* text = reinterpret_cast<const char*>(static_cast<std::intptr_t>(call.value));
        out.value = text ? text : "";
        return out;
    }

private:
    std::shared_ptr<GenerationState> generation_;
    std::string name_;
    std::int64_t (*fn_)();
};

} // namespace

const char* tier_name(ClassLoaderTier tier) {
    switch (tier) {
        case ClassLoaderTier::Runtime: return "runtime";
        case ClassLoaderTier::CompilerInternal: return "compiler";
        case ClassLoaderTier::Plugin: return "plugin";
    }
    return "unknown";
}

Loader::Loader(std::shared_ptr<GenerationState> generation, ClassLoaderTier tier, bool coalesced,
               llvm::orc::JITDylib* home, std::vector<llvm::orc::JITDylib*> search_order)
    : generation_(std::move(generation)), tier_(tier), coalesced_(coalesced), home_(home), search_order_(std::move(search_order)) {}

bool Loader::retired() const {
    return generation_->retired;
}

std::uint64_t Loader::generation() const {
    return generation_->id;
}

llvm::Error Loader::check_live() const {
    if (generation_->retired) {
        return make_error_text(std::string(tier_name(tier_)) + " loader of generation " + std::to_string(generation_->id) + " was retired");
    }
    return llvm::Error::success();
}

llvm::Expected<std::uint64_t> Loader::lookup(const std::string& symbol) {
    if (auto err = check_live()) {
        return std::move(err);
    }
    llvm::orc::LLJIT& jit = *generation_->jit;
    auto sym = jit.getExecutionSession().lookup(llvm::orc::makeJITDylibSearchOrder(search_order_), jit.mangleAndIntern(symbol));
    if (!sym) {
        return sym.takeError();
    }
    return symbol_address(*sym);
}

llvm::Expected<std::unique_ptr<Loadable>> Loader::resolve(const std::string& artifact) {
    if (auto err = check_live()) {
        return std::move(err);
    }
    auto address = lookup(artifact + ".$main");
    if (!address) {
        return make_error_text("class " + artifact + " not found (" + llvm::toString(address.takeError()) + ")");
    }
    auto fn = reinterpret_cast<std::int64_t (*)()>(static_cast<std::uintptr_t>(*address));
    return std::make_unique<EntryPoint>(generation_, artifact, fn);
}

bool Loader::has_symbol(const std::string& symbol) {
    auto address = lookup(symbol);
    if (!address) {
        llvm::consumeError(address.takeError());
        return false;
    }
    return true;
}

llvm::Expected<std::int64_t> Loader::evaluate(llvm::orc::ThreadSafeModule module, const std::string& entry) {
    if (auto err = check_live()) {
        return std::move(err);
    }
    llvm::orc::ResourceTrackerSP tracker = home_->createResourceTracker();
    if (auto err = generation_->jit->addIRModule(tracker, std::move(module))) {
        return std::move(err);
    }

    std::int64_t value = 0;
    std::optional<std::string> failure;
    if (auto address = lookup(entry)) {
        runtime::RuntimeContext* ctx = runtime::current_context();
        if (!ctx) {
            failure = "no runtime context is active";
        } else {
            auto fn = reinterpret_cast<std::int64_t (*)()>(static_cast<std::uintptr_t>(*address));
            runtime::CallOutcome call = ctx->call_guarded(fn, runtime::kHostFrame);
            if (call.fault) {
                failure = describe(call.fault);
            } else {
                value = call.value;
            }
        }
    } else {
        failure = llvm::toString(address.takeError());
    }

    if (auto err = tracker->remove()) {
        std::string removal = llvm::toString(std::move(err));
        failure = failure ? *failure + "; " + removal : removal;
    }
    if (failure) {
        return make_error_text(*failure);
    }
    return value;
}

} // namespace kiln::backend::registry
