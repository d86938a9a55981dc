#include "frontend/interactive/import_ledger.hpp"

namespace kiln::frontend::interactive {

std::string ImportEntry::render() const {
    if (wildcard) {
        return "import " + prefix + "._";
    }
    if (local == source) {
        return "import " + prefix + "." + source;
    }
    return "import " + prefix + ".{" + source + " => " + local + "}";
}

bool ImportEntry::operator==(const ImportEntry& other) const {
    return local == other.local && source == other.source && prefix == other.prefix &&
           wildcard == other.wildcard && implicit == other.implicit && relative == other.relative;
}

ImportEntry wildcard_import(const std::string& prefix) {
    ImportEntry entry;
    entry.local = "_";
    entry.source = "_";
    entry.prefix = prefix;
    entry.wildcard = true;
    return entry;
}

void ImportLedger::update(const std::vector<ImportEntry>& entries) {
    for (const auto& entry : entries) {
        if (entry.wildcard) {
            entries_.push_back(entry);
            continue;
        }

        bool replaced = false;
        for (auto& existing : entries_) {
            if (!existing.wildcard && existing.local == entry.local) {
                existing = entry;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            entries_.push_back(entry);
        }
    }
}

std::string ImportLedger::previous_import_block(const std::set<std::string>& referenced) const {
    std::string block;
    for (const auto& entry : entries_) {
        if (entry.wildcard || entry.implicit || referenced.count(entry.local)) {
            block += entry.render();
            block += "\n";
        }
    }
    return block;
}

std::string ImportLedger::previous_import_block() const {
    std::string block;
    for (const auto& entry : entries_) {
        block += entry.render();
        block += "\n";
    }
    return block;
}

} // namespace kiln::frontend::interactive
