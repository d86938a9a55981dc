#include "frontend/interactive/history.hpp"

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

namespace kiln::frontend::interactive {

std::vector<std::string> HistoryFile::load() const {
    std::vector<std::string> records;
    auto buffer = llvm::MemoryBuffer::getFile(path_);
    if (!buffer) {
        return records;
    }

    llvm::StringRef rest = (*buffer)->getBuffer();
    while (!rest.empty()) {
        auto parts = rest.split(kHistoryDelimiter);
        if (!parts.first.empty()) {
            records.push_back(parts.first.str());
        }
        rest = parts.second;
    }
    return records;
}

llvm::Error HistoryFile::append(const std::string& record) const {
    std::error_code ec;
    llvm::raw_fd_ostream out(path_, ec, llvm::sys::fs::OF_Append);
    if (ec) {
        return llvm::make_error<llvm::StringError>("cannot open history file " + path_ + ": " + ec.message(), ec);
    }
    out << kHistoryDelimiter << record;
    out.close();
    if (out.has_error()) {
        std::error_code write_error = out.error();
        out.clear_error();
        return llvm::make_error<llvm::StringError>("cannot write history file " + path_, write_error);
    }
    return llvm::Error::success();
}

} // namespace kiln::frontend::interactive
