#include "backend/resolver/dependency_resolver.hpp"

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

namespace kiln::backend::resolver {

std::vector<std::string> FilesystemResolver::candidates(const std::string& coordinate) const {
    std::string name = coordinate;
    std::string version;
    std::size_t colon = coordinate.find(':');
    if (colon != std::string::npos) {
        name = coordinate.substr(0, colon);
        version = coordinate.substr(colon + 1);
    }

    std::vector<std::string> files;
    files.push_back(version.empty() ? "lib" + name + ".so" : "lib" + name + ".so." + version);
    files.push_back(name + ".bc");
    files.push_back(name + ".ll");
    return files;
}

llvm::Expected<std::vector<std::string>> FilesystemResolver::resolve(const std::vector<std::string>& coordinates) {
    std::vector<std::string> resolved;
    std::vector<std::string> missing;

    for (const auto& coordinate : coordinates) {
        std::string found;
        std::vector<std::string> files = candidates(coordinate);
        for (const auto& dir : search_dirs_) {
            for (const auto& file : files) {
                llvm::SmallString<256> path(dir);
                llvm::sys::path::append(path, file);
                if (llvm::sys::fs::is_regular_file(path)) {
                    found = path.str().str();
                    break;
                }
            }
            if (!found.empty()) break;
        }

        if (found.empty()) {
            missing.push_back(coordinate);
        } else {
            resolved.push_back(found);
        }
    }

    if (!missing.empty()) {
        std::string message = "unresolved dependencies:";
        for (const auto& coordinate : missing) {
            message += " " + coordinate;
        }
        return llvm::make_error<llvm::StringError>(message, llvm::inconvertibleErrorCode());
    }
    return resolved;
}

} // namespace kiln::backend::resolver
