#include <iostream>
#include <string>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include "frontend/interactive/history.hpp"

using namespace kiln::frontend::interactive;

static int failures = 0;

static void expect(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")\n";
        ++failures;
    }
}

int main() {
    llvm::SmallString<128> path;
    if (std::error_code ec = llvm::sys::fs::createTemporaryFile("kiln-history", "txt", path)) {
        std::cerr << "FAIL(setup): " << ec.message() << "\n";
        return 1;
    }
    llvm::sys::fs::remove(path);

    HistoryFile history(path.str().str());
    expect(history.load().empty(), "missing_file_is_empty");

    for (const char* record : {"val x = 1", "def f() = {\n  x\n}", "f()"}) {
        if (llvm::Error err = history.append(record)) {
            std::cerr << "FAIL(append): " << llvm::toString(std::move(err)) << "\n";
            return 1;
        }
    }

    std::vector<std::string> records = history.load();
    expect(records.size() == 3, "round_trip.count");
    expect(records.size() == 3 && records[1] == "def f() = {\n  x\n}", "round_trip.multiline");

    // records are written after the delimiter, so the file starts with one
    HistoryFile reopened(path.str().str());
    expect(reopened.load() == records, "reload");

    HistoryFile unwritable("/nonexistent-dir/kiln/history");
    llvm::Error err = unwritable.append("x");
    expect(static_cast<bool>(err), "unwritable_reports_error");
    llvm::consumeError(std::move(err));

    llvm::sys::fs::remove(path);
    if (failures) {
        std::cerr << failures << " history test(s) failed\n";
        return 1;
    }
    std::cout << "history tests passed\n";
    return 0;
}
