#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>

#include "backend/registry/loader.hpp"

namespace kiln::backend::registry {

struct GenerationState;

// One compiled top-level module or class.
struct Artifact {
    std::string name;
    // LLVM bitcode
    std::string bytes;
    // wrapper source the artifact was compiled from
    std::string source;
};

/**
 * ArtifactRegistry
 *
 * Per tier, an append-only list of classpath roots (shared libraries,
 * bitcode or textual IR, or directories holding them) and a loader derived
 * from them. Loaders are built lazily and replaced whenever their inputs
 * change, so callers re-fetch them through current_loader() instead of
 * holding on to them.
 *
 * All loaders of one registry share an LLJIT instance, the generation.
 * Artifacts live in the generation's artifact dylib, which the Runtime
 * loader searches first. Switching the shared compile/execute mode after a
 * Runtime or CompilerInternal loader was built retires the generation:
 * artifacts are dropped, the JIT is torn down and every loader handed out
 * so far stops resolving.
 */
class ArtifactRegistry {
public:
    using PathsObserver = std::function<void(ClassLoaderTier, const std::vector<std::string>&)>;

    ArtifactRegistry();
    ~ArtifactRegistry();

    ArtifactRegistry(const ArtifactRegistry&) = delete;
    ArtifactRegistry& operator=(const ArtifactRegistry&) = delete;

    // Appends the paths that exist; returns the accepted ones.
    std::vector<std::string> add_paths(ClassLoaderTier tier, const std::vector<std::string>& paths);
    const std::vector<std::string>& paths(ClassLoaderTier tier) const;
    void on_paths_added(PathsObserver observer);

    // Adds or replaces an artifact. The old code of a replaced artifact is unloaded first.
    llvm::Error add_artifact(const std::string& name, std::string bytes, std::string source);
    std::optional<std::string> lookup_artifact(const std::string& name) const;
    std::vector<std::string> artifact_names() const;

    // Fails only when the JIT for a new generation cannot be created.
    llvm::Expected<std::shared_ptr<Loader>> current_loader(ClassLoaderTier tier);

    // Returns true when a built loader was replaced and the generation retired.
    bool set_shared_compile_execute_mode(bool enabled);
    bool shared_compile_execute_mode() const { return shared_mode_; }

    // Whether Plugin roots are visible to the CompilerInternal loader.
    void set_plugins_enabled(bool enabled);
    bool plugins_enabled() const { return plugins_enabled_; }

    std::uint64_t generation() const { return generation_id_; }

private:
    struct TierState {
        std::vector<std::string> paths;
        std::shared_ptr<Loader> loader;
        bool classpath_dirty = true;
    };

    TierState& state(ClassLoaderTier tier);
    const TierState& state(ClassLoaderTier tier) const;

    llvm::Error ensure_generation();
    void retire_generation();
    llvm::Error refresh_classpath(ClassLoaderTier tier);
    llvm::Expected<std::shared_ptr<Loader>> build_loader(ClassLoaderTier tier);
    void invalidate_loader(ClassLoaderTier tier);

    TierState tiers_[3];
    std::map<std::string, Artifact> artifacts_;
    std::vector<PathsObserver> observers_;

    std::shared_ptr<GenerationState> generation_;
    std::uint64_t generation_id_ = 1;
    bool shared_mode_ = false;
    bool plugins_enabled_ = true;
};

} // namespace kiln::backend::registry
