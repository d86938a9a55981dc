#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/Support/Error.h>

#include "backend/runtime/runtime_context.hpp"

namespace llvm::orc {
class JITDylib;
}

namespace kiln::backend::registry {

struct GenerationState;

enum class ClassLoaderTier {
    Runtime,
    // code run on behalf of the compiler, e.g. `inline val` initializers
    CompilerInternal,
    Plugin,
};

const char* tier_name(ClassLoaderTier tier);

struct InvokeOutcome {
    std::string value;
    runtime::FaultPtr fault;
};

// A resolved entry point of a wrapper.
class Loadable {
public:
    virtual ~Loadable() = default;

    virtual const std::string& name() const = 0;

    // Runs the entry under the calling thread's runtime context. Faults come
    // back wrapped in an invocation fault.
    virtual InvokeOutcome invoke_entry() = 0;
};

/**
 * Loader
 *
 * Resolves symbols through an ordered list of JIT dylibs of one generation:
 * its home dylib first, then classpath roots, then the runtime ABI and the
 * host process. Once its generation is retired every operation fails.
 */
class Loader {
public:
    Loader(std::shared_ptr<GenerationState> generation, ClassLoaderTier tier, bool coalesced,
           llvm::orc::JITDylib* home, std::vector<llvm::orc::JITDylib*> search_order);

    // Entry point `<artifact>.$main`.
    llvm::Expected<std::unique_ptr<Loadable>> resolve(const std::string& artifact);

    bool has_symbol(const std::string& symbol);

    // Adds `module` to the home dylib, runs its nullary `entry` and unloads it again.
    llvm::Expected<std::int64_t> evaluate(llvm::orc::ThreadSafeModule module, const std::string& entry);

    bool retired() const;
    ClassLoaderTier tier() const { return tier_; }
    bool coalesced() const { return coalesced_; }
    std::uint64_t generation() const;

private:
    llvm::Error check_live() const;
    llvm::Expected<std::uint64_t> lookup(const std::string& symbol);

    std::shared_ptr<GenerationState> generation_;
    ClassLoaderTier tier_;
    bool coalesced_;
    llvm::orc::JITDylib* home_;
    std::vector<llvm::orc::JITDylib*> search_order_;
};

} // namespace kiln::backend::registry
