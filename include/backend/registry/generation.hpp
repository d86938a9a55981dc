#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/Core.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>

namespace kiln::backend::registry {

/**
 * GenerationState
 *
 * One LLJIT instance with the dylibs every loader of the generation links
 * against. `main` holds the runtime ABI and the host process symbols;
 * artifacts and compile-time probes get their own dylibs so the
 * CompilerInternal tier only sees user code when the tiers are coalesced.
 */
struct GenerationState {
    std::uint64_t id = 0;
    std::unique_ptr<llvm::orc::LLJIT> jit;

    llvm::orc::JITDylib* main = nullptr;
    llvm::orc::JITDylib* artifacts = nullptr;
    llvm::orc::JITDylib* compile_time = nullptr;
    // latest classpath dylib per tier, indexed by ClassLoaderTier
    llvm::orc::JITDylib* classpath[3] = {nullptr, nullptr, nullptr};

    std::map<std::string, llvm::orc::ResourceTrackerSP> trackers;
    unsigned next_dylib = 0;
    bool retired = false;
};

// Address of a looked up symbol, across the ORC API change in LLVM 17.
#if LLVM_VERSION_MAJOR >= 17
inline std::uint64_t symbol_address(const llvm::orc::ExecutorSymbolDef& sym) {
    return sym.getAddress().getValue();
}
#else
inline std::uint64_t symbol_address(const llvm::JITEvaluatedSymbol& sym) {
    return sym.getAddress();
}
#endif

} // namespace kiln::backend::registry
