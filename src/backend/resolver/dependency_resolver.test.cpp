#include <iostream>
#include <string>

#include "backend/resolver/dependency_resolver.hpp"

using kiln::backend::resolver::FilesystemResolver;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ": " + detail) << "\n";
        ++failures;
    }
}

static const std::string kFixtures = std::string(KILN_SOURCE_DIR) + "/tests/fixtures";

int main() {
    FilesystemResolver resolver({kFixtures + "/missing-dir", kFixtures + "/libs", kFixtures + "/classpath"});

    auto found = resolver.resolve({"mathlib", "zlibish:1"});
    if (!found) {
        std::cerr << "FAIL(resolve): " << llvm::toString(found.takeError()) << "\n";
        return 1;
    }
    expect(found->size() == 2, "resolve.count");
    expect(found->size() == 2 && (*found)[0] == kFixtures + "/libs/mathlib.ll", "resolve.first_dir_wins", (*found)[0]);
    expect(found->size() == 2 && (*found)[1] == kFixtures + "/libs/libzlibish.so.1", "resolve.versioned");

    auto unversioned = resolver.resolve({"zlibish"});
    expect(!unversioned, "resolve.version_required_for_versioned_file");
    if (!unversioned) {
        std::string message = llvm::toString(unversioned.takeError());
        expect(message == "unresolved dependencies: zlibish", "resolve.message", message);
    }

    auto missing = resolver.resolve({"mathlib", "nope", "other:2"});
    expect(!missing, "resolve.missing");
    if (!missing) {
        std::string message = llvm::toString(missing.takeError());
        expect(message == "unresolved dependencies: nope other:2", "resolve.lists_all", message);
    }

    auto empty = resolver.resolve({});
    expect(empty && empty->empty(), "resolve.empty");
    if (!empty) llvm::consumeError(empty.takeError());

    if (failures) {
        std::cerr << failures << " dependency resolver test(s) failed\n";
        return 1;
    }
    std::cout << "dependency resolver tests passed\n";
    return 0;
}
