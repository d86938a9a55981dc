#include "frontend/checker/symbols.hpp"

namespace kiln::frontend {

std::string Type::to_string() const {
    switch (kind) {
        case TypeKind::Int: return "Int";
        case TypeKind::Str: return "Str";
        case TypeKind::Unit: return "Unit";
        case TypeKind::Object: return container ? container->name : "<object>";
        case TypeKind::Namespace:
            if (!container) return "<namespace>";
            return (container->is_class ? "class " : "module ") + container->qualified;
        case TypeKind::Error: break;
    }
    return "<error>";
}

const MemberSymbol* ContainerSymbol::find(const std::string& member) const {
    auto it = index.find(member);
    if (it == index.end()) return nullptr;
    return members[it->second].get();
}

MemberSymbol* ContainerSymbol::add(std::shared_ptr<MemberSymbol> member) {
    member->owner = this;
    index[member->name] = members.size();
    members.push_back(std::move(member));
    return members.back().get();
}

std::shared_ptr<ContainerSymbol> SymbolTable::find_global(const std::string& name) const {
    auto it = globals_.find(name);
    return it == globals_.end() ? nullptr : it->second;
}

void SymbolTable::commit(const std::vector<std::shared_ptr<ContainerSymbol>>& containers) {
    for (const auto& c : containers) {
        globals_[c->name] = c;
    }
}

void SymbolTable::reset() {
    globals_.clear();
}

std::vector<std::string> SymbolTable::global_names() const {
    std::vector<std::string> names;
    names.reserve(globals_.size());
    for (const auto& [name, _] : globals_) {
        names.push_back(name);
    }
    return names;
}

} // namespace kiln::frontend
