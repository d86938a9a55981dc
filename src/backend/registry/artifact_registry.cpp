#include "backend/registry/artifact_registry.hpp"

#include <algorithm>
#include <mutex>

#include <llvm/Bitcode/BitcodeReader.h>
#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/IRReader/IRReader.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/WithColor.h>

#include "backend/registry/generation.hpp"
#include "backend/runtime/kiln_runtime.h"

namespace kiln::backend::registry {

namespace {

struct RuntimeSymbol {
    const char* name;
    void* address;
};

const RuntimeSymbol kRuntimeSymbols[] = {
    {"kiln_rt_enter", reinterpret_cast<void*>(&kiln_rt_enter)},
    {"kiln_rt_leave", reinterpret_cast<void*>(&kiln_rt_leave)},
    {"kiln_rt_init_module", reinterpret_cast<void*>(&kiln_rt_init_module)},
    {"kiln_rt_alloc", reinterpret_cast<void*>(&kiln_rt_alloc)},
    {"kiln_rt_concat", reinterpret_cast<void*>(&kiln_rt_concat)},
    {"kiln_rt_str_eq", reinterpret_cast<void*>(&kiln_rt_str_eq)},
    {"kiln_rt_int_to_str", reinterpret_cast<void*>(&kiln_rt_int_to_str)},
    {"kiln_rt_show_int", reinterpret_cast<void*>(&kiln_rt_show_int)},
    {"kiln_rt_show_str", reinterpret_cast<void*>(&kiln_rt_show_str)},
    {"kiln_rt_show_obj", reinterpret_cast<void*>(&kiln_rt_show_obj)},
    {"kiln_rt_div", reinterpret_cast<void*>(&kiln_rt_div)},
    {"kiln_rt_mod", reinterpret_cast<void*>(&kiln_rt_mod)},
    {"kiln_rt_exit", reinterpret_cast<void*>(&kiln_rt_exit)},
    {"kiln_rt_fail", reinterpret_cast<void*>(&kiln_rt_fail)},
    {"kiln_rt_println", reinterpret_cast<void*>(&kiln_rt_println)},
};

#undef KILN_RUNTIME_SYMBOL

void initialize_native_target() {
    static std::once_flag once;
    std::call_once(once, [] {
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
        llvm::InitializeNativeTargetAsmParser();
    });
}

llvm::Error make_error_text(const std::string& message) {
    return llvm::make_error<llvm::StringError>(message, llvm::inconvertibleErrorCode());
}

std::size_t index_of(ClassLoaderTier tier) {
    return static_cast<std::size_t>(tier);
}

llvm::Error define_runtime_symbols(llvm::orc::LLJIT& jit, llvm::orc::JITDylib& dylib) {
    llvm::orc::SymbolMap symbols;
    for (const auto& entry : kRuntimeSymbols) {
#if LLVM_VERSION_MAJOR >= 17
        symbols[jit.mangleAndIntern(entry.name)] =
            llvm::orc::ExecutorSymbolDef(llvm::orc::ExecutorAddr::fromPtr(entry.address), llvm::JITSymbolFlags::Exported);
#else
        symbols[jit.mangleAndIntern(entry.name)] =
            llvm::JITEvaluatedSymbol::fromPointer(entry.address, llvm::JITSymbolFlags::Exported);
#endif
    }
    return dylib.define(llvm::orc::absoluteSymbols(std::move(symbols)));
}

bool is_root_file(const std::string& file) {
    std::string name = llvm::sys::path::filename(file).str();
    auto ends_with = [&](const std::string& suffix) {
        return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".so") || ends_with(".bc") || ends_with(".ll") || name.find(".so.") != std::string::npos;
}

// Files a classpath root stands for: the root itself, or the loadable files of a directory.
std::vector<std::string> expand_root(const std::string& root) {
    if (!llvm::sys::fs::is_directory(root)) {
        return {root};
    }
    std::vector<std::string> files;
    std::error_code ec;
    for (llvm::sys::fs::directory_iterator it(root, ec), end; it != end && !ec; it.increment(ec)) {
        if (is_root_file(it->path())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

llvm::Error load_root(llvm::orc::LLJIT& jit, llvm::orc::JITDylib& dylib, const std::string& file) {
    llvm::StringRef extension = llvm::sys::path::extension(file);
    if (extension == ".bc" || extension == ".ll") {
        auto context = std::make_unique<llvm::LLVMContext>();
        llvm::SMDiagnostic diagnostic;
        std::unique_ptr<llvm::Module> module = llvm::parseIRFile(file, diagnostic, *context);
        if (!module) {
            std::string text;
            llvm::raw_string_ostream os(text);
            diagnostic.print("kiln", os);
            return make_error_text(os.str());
        }
        return jit.addIRModule(dylib, llvm::orc::ThreadSafeModule(std::move(module), std::move(context)));
    }

    auto generator = llvm::orc::DynamicLibrarySearchGenerator::Load(file.c_str(), jit.getDataLayout().getGlobalPrefix());
    if (!generator) {
        return generator.takeError();
    }
    dylib.addGenerator(std::move(*generator));
    return llvm::Error::success();
}

} // namespace

ArtifactRegistry::ArtifactRegistry() = default;
ArtifactRegistry::~ArtifactRegistry() = default;

ArtifactRegistry::TierState& ArtifactRegistry::state(ClassLoaderTier tier) {
    return tiers_[index_of(tier)];
}

const ArtifactRegistry::TierState& ArtifactRegistry::state(ClassLoaderTier tier) const {
    return tiers_[index_of(tier)];
}

std::vector<std::string> ArtifactRegistry::add_paths(ClassLoaderTier tier, const std::vector<std::string>& paths) {
    std::vector<std::string> accepted;
    for (const auto& path : paths) {
        if (llvm::sys::fs::exists(path)) {
            accepted.push_back(path);
        }
    }
    if (accepted.empty()) {
        return accepted;
    }

    TierState& ts = state(tier);
    ts.paths.insert(ts.paths.end(), accepted.begin(), accepted.end());
    ts.classpath_dirty = true;
    invalidate_loader(tier);
    if (tier == ClassLoaderTier::Plugin) {
        invalidate_loader(ClassLoaderTier::CompilerInternal);
    }

    for (const auto& observer : observers_) {
        observer(tier, accepted);
    }
    return accepted;
}

const std::vector<std::string>& ArtifactRegistry::paths(ClassLoaderTier tier) const {
    return state(tier).paths;
}

void ArtifactRegistry::on_paths_added(PathsObserver observer) {
    observers_.push_back(std::move(observer));
}

void ArtifactRegistry::set_plugins_enabled(bool enabled) {
    if (plugins_enabled_ == enabled) return;
    plugins_enabled_ = enabled;
    invalidate_loader(ClassLoaderTier::CompilerInternal);
}

void ArtifactRegistry::invalidate_loader(ClassLoaderTier tier) {
    state(tier).loader.reset();
    if (shared_mode_ && tier != ClassLoaderTier::Plugin) {
        state(ClassLoaderTier::Runtime).loader.reset();
        state(ClassLoaderTier::CompilerInternal).loader.reset();
    }
}

llvm::Error ArtifactRegistry::add_artifact(const std::string& name, std::string bytes, std::string source) {
    // the artifact dylib links against what the Runtime loader was built from
    auto runtime_loader = current_loader(ClassLoaderTier::Runtime);
    if (!runtime_loader) {
        return runtime_loader.takeError();
    }
    GenerationState& gen = *generation_;

    auto existing = gen.trackers.find(name);
    if (existing != gen.trackers.end()) {
        if (auto err = existing->second->remove()) {
            return err;
        }
        gen.trackers.erase(existing);
        artifacts_.erase(name);
    }

    auto context = std::make_unique<llvm::LLVMContext>();
    auto module = llvm::parseBitcodeFile(llvm::MemoryBufferRef(bytes, name), *context);
    if (!module) {
        return module.takeError();
    }

    llvm::orc::ResourceTrackerSP tracker = gen.artifacts->createResourceTracker();
    if (auto err = gen.jit->addIRModule(tracker, llvm::orc::ThreadSafeModule(std::move(*module), std::move(context)))) {
        return err;
    }
    gen.trackers[name] = tracker;
    artifacts_[name] = Artifact{name, std::move(bytes), std::move(source)};
    return llvm::Error::success();
}

std::optional<std::string> ArtifactRegistry::lookup_artifact(const std::string& name) const {
    auto it = artifacts_.find(name);
    if (it == artifacts_.end()) {
        return std::nullopt;
    }
    return it->second.bytes;
}

std::vector<std::string> ArtifactRegistry::artifact_names() const {
    std::vector<std::string> names;
    names.reserve(artifacts_.size());
    for (const auto& entry : artifacts_) {
        names.push_back(entry.first);
    }
    return names;
}

llvm::Expected<std::shared_ptr<Loader>> ArtifactRegistry::current_loader(ClassLoaderTier tier) {
    TierState& ts = state(tier);
    if (ts.loader && !ts.loader->retired()) {
        return ts.loader;
    }

    auto loader = build_loader(tier);
    if (!loader) {
        return loader.takeError();
    }
    if ((*loader)->coalesced()) {
        state(ClassLoaderTier::Runtime).loader = *loader;
        state(ClassLoaderTier::CompilerInternal).loader = *loader;
    } else {
        ts.loader = *loader;
    }
    return *loader;
}

bool ArtifactRegistry::set_shared_compile_execute_mode(bool enabled) {
    if (shared_mode_ == enabled) {
        return false;
    }
    shared_mode_ = enabled;

    bool built = state(ClassLoaderTier::Runtime).loader || state(ClassLoaderTier::CompilerInternal).loader;
    if (!built) {
        return false;
    }
    retire_generation();
    return true;
}

llvm::Error ArtifactRegistry::ensure_generation() {
    if (generation_) {
        return llvm::Error::success();
    }
    initialize_native_target();

    auto jit = llvm::orc::LLJITBuilder().create();
    if (!jit) {
        return jit.takeError();
    }

    auto gen = std::make_shared<GenerationState>();
    gen->id = generation_id_;
    gen->jit = std::move(*jit);

    llvm::orc::ExecutionSession& es = gen->jit->getExecutionSession();
    es.setErrorReporter([](llvm::Error err) {
        llvm::logAllUnhandledErrors(std::move(err), llvm::WithColor::warning(), "jit: ");
    });

    gen->main = &gen->jit->getMainJITDylib();
    if (auto err = define_runtime_symbols(*gen->jit, *gen->main)) {
        return err;
    }
    auto process = llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(gen->jit->getDataLayout().getGlobalPrefix());
    if (!process) {
        return process.takeError();
    }
    gen->main->addGenerator(std::move(*process));

    auto artifacts = es.createJITDylib("kiln.artifacts");
    if (!artifacts) {
        return artifacts.takeError();
    }
    gen->artifacts = &*artifacts;

    auto compile_time = es.createJITDylib("kiln.compile_time");
    if (!compile_time) {
        return compile_time.takeError();
    }
    gen->compile_time = &*compile_time;

    generation_ = std::move(gen);
    for (auto& ts : tiers_) {
        ts.classpath_dirty = true;
    }
    return llvm::Error::success();
}

void ArtifactRegistry::retire_generation() {
    if (generation_) {
        generation_->retired = true;
        generation_->trackers.clear();
        // tears down every dylib; loaders still holding the state only see `retired`
        generation_->jit.reset();
        generation_.reset();
    }
    ++generation_id_;
    artifacts_.clear();
    for (auto& ts : tiers_) {
        ts.loader.reset();
        ts.classpath_dirty = true;
    }
}

llvm::Error ArtifactRegistry::refresh_classpath(ClassLoaderTier tier) {
    TierState& ts = state(tier);
    GenerationState& gen = *generation_;
    std::size_t index = index_of(tier);
    if (!ts.classpath_dirty && gen.classpath[index]) {
        return llvm::Error::success();
    }

    std::string name = std::string("kiln.classpath.") + tier_name(tier) + "." + std::to_string(gen.next_dylib++);
    auto dylib = gen.jit->getExecutionSession().createJITDylib(name);
    if (!dylib) {
        return dylib.takeError();
    }
    llvm::orc::JITDylib& jd = *dylib;
    jd.setLinkOrder(llvm::orc::makeJITDylibSearchOrder({gen.main}), true);

    for (const auto& root : ts.paths) {
        for (const auto& file : expand_root(root)) {
            if (auto err = load_root(*gen.jit, jd, file)) {
                llvm::WithColor::warning() << "could not load classpath root " << file << ": " << llvm::toString(std::move(err)) << "\n";
            }
        }
    }

    gen.classpath[index] = &jd;
    ts.classpath_dirty = false;
    return llvm::Error::success();
}

llvm::Expected<std::shared_ptr<Loader>> ArtifactRegistry::build_loader(ClassLoaderTier tier) {
    if (auto err = ensure_generation()) {
        return std::move(err);
    }
    GenerationState& gen = *generation_;

    bool coalesced = shared_mode_ && tier != ClassLoaderTier::Plugin;
    llvm::orc::JITDylib* home = nullptr;
    std::vector<ClassLoaderTier> roots;
    if (coalesced) {
        home = gen.artifacts;
        roots = {ClassLoaderTier::Runtime, ClassLoaderTier::CompilerInternal};
        if (plugins_enabled_) roots.push_back(ClassLoaderTier::Plugin);
    } else if (tier == ClassLoaderTier::Runtime) {
        home = gen.artifacts;
        roots = {ClassLoaderTier::Runtime};
    } else if (tier == ClassLoaderTier::CompilerInternal) {
        home = gen.compile_time;
        roots = {ClassLoaderTier::CompilerInternal};
        if (plugins_enabled_) roots.push_back(ClassLoaderTier::Plugin);
    } else {
        roots = {ClassLoaderTier::Plugin};
    }

    std::vector<llvm::orc::JITDylib*> links;
    for (ClassLoaderTier root : roots) {
        if (auto err = refresh_classpath(root)) {
            return std::move(err);
        }
        links.push_back(gen.classpath[index_of(root)]);
    }
    links.push_back(gen.main);

    if (!home) {
        home = links.front();
        links.erase(links.begin());
    }
    home->setLinkOrder(llvm::orc::makeJITDylibSearchOrder(links), true);

    std::vector<llvm::orc::JITDylib*> search_order{home};
    search_order.insert(search_order.end(), links.begin(), links.end());
    return std::make_shared<Loader>(generation_, tier, coalesced, home, std::move(search_order));
}

} // namespace kiln::backend::registry
