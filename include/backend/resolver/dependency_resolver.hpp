#pragma once

#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace kiln::backend::resolver {

class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    // Paths of the files providing `coordinates`, in coordinate order.
    virtual llvm::Expected<std::vector<std::string>> resolve(const std::vector<std::string>& coordinates) = 0;
};

/**
 * FilesystemResolver
 *
 * Resolves `name[:version]` against a list of directories. The first
 * directory holding `lib<name>.so[.<version>]`, `<name>.bc` or `<name>.ll`
 * wins; every coordinate left unresolved is listed in the error.
 */
class FilesystemResolver : public DependencyResolver {
public:
    explicit FilesystemResolver(std::vector<std::string> search_dirs) : search_dirs_(std::move(search_dirs)) {}

    llvm::Expected<std::vector<std::string>> resolve(const std::vector<std::string>& coordinates) override;

    void add_search_dir(std::string dir) { search_dirs_.push_back(std::move(dir)); }
    const std::vector<std::string>& search_dirs() const { return search_dirs_; }

private:
    std::vector<std::string> candidates(const std::string& coordinate) const;

    std::vector<std::string> search_dirs_;
};

} // namespace kiln::backend::resolver
