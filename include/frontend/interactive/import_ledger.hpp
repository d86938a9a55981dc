#pragma once

#include <set>
#include <string>
#include <vector>

namespace kiln::frontend::interactive {

/**
 * ImportEntry
 *
 * One import binding carried from a finished fragment into later ones.
 * `prefix` names the producing wrapper or an external module; an exported
 * entry leaves the compiler with an empty prefix (or a `relative` one) and
 * gets the wrapper's user prefix once the fragment ran.
 */
struct ImportEntry {
    std::string local;
    std::string source;
    std::string prefix;
    bool wildcard = false;
    bool implicit = false;
    bool relative = false;

    std::string render() const;

    bool operator==(const ImportEntry& other) const;
};

ImportEntry wildcard_import(const std::string& prefix);

class ImportLedger {
public:
    // Named entries replace a live entry of the same local name in place;
    // wildcards always append.
    void update(const std::vector<ImportEntry>& entries);

    // Entries whose local name is referenced, plus every implicit and
    // wildcard entry, one import per line in ledger order.
    std::string previous_import_block(const std::set<std::string>& referenced) const;
    std::string previous_import_block() const;

    const std::vector<ImportEntry>& entries() const { return entries_; }
    void clear() { entries_.clear(); }

private:
    std::vector<ImportEntry> entries_;
};

} // namespace kiln::frontend::interactive
