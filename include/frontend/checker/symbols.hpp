#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "frontend/checker/type.hpp"

namespace kiln::frontend {

enum class MemberKind {
    Val,
    LazyVal,
    InlineVal,
    Def,
    Extern,
    Container,
};

struct Param {
    std::string name;
    Type type;
};

struct ContainerSymbol;

/**
 * MemberSymbol
 *
 * One member of a module or class. `symbol` is the name the code generator
 * gives the storage or function; for externs it is the raw C symbol.
 */
struct MemberSymbol {
    std::string name;
    MemberKind kind = MemberKind::Val;
    bool implicit = false;

    std::vector<Param> params;
    bool has_parens = true;

    // value type, or result type for defs and externs
    Type type;
    std::int64_t constant = 0;

    // object slots for class fields
    int slot = -1;
    int flag_slot = -1;
    bool is_param = false;

    std::string symbol;
    std::shared_ptr<ContainerSymbol> nested;
    const ContainerSymbol* owner = nullptr;

    bool is_callable() const { return kind == MemberKind::Def || kind == MemberKind::Extern; }
};

struct ContainerSymbol {
    bool is_class = false;
    std::string name;
    // dotted path from the top-level container, e.g. "cmd3.Point"
    std::string qualified;
    const ContainerSymbol* owner = nullptr;

    std::vector<std::shared_ptr<MemberSymbol>> members;
    std::unordered_map<std::string, std::size_t> index;

    std::vector<Param> ctor_params;
    // slot 0 holds the class name
    int slot_count = 1;

    // name of the top-level artifact holding this container's code
    std::string artifact;

    const MemberSymbol* find(const std::string& member) const;
    MemberSymbol* add(std::shared_ptr<MemberSymbol> member);
};

/**
 * SymbolTable
 *
 * Top-level modules and classes of every unit compiled so far. Units only
 * become visible here once they compiled successfully.
 */
class SymbolTable {
public:
    std::shared_ptr<ContainerSymbol> find_global(const std::string& name) const;
    void commit(const std::vector<std::shared_ptr<ContainerSymbol>>& containers);
    void reset();
    std::vector<std::string> global_names() const;

private:
    std::map<std::string, std::shared_ptr<ContainerSymbol>> globals_;
};

} // namespace kiln::frontend
