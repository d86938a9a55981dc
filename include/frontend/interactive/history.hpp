#pragma once

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln::frontend::interactive {

constexpr const char* kHistoryDelimiter = "\n\n\n";

// Fragments persisted across sessions, one record per submitted fragment.
class HistoryFile {
public:
    explicit HistoryFile(std::string path) : path_(std::move(path)) {}

    // A missing file reads as no history.
    std::vector<std::string> load() const;
    llvm::Error append(const std::string& record) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace kiln::frontend::interactive
