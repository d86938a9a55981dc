#pragma once

#include <string>

namespace kiln::frontend {

struct ContainerSymbol;

enum class TypeKind {
    Error,
    Int,
    Str,
    Unit,
    // instance of a user class
    Object,
    // a module or class used as a path prefix; never a value
    Namespace,
};

struct Type {
    TypeKind kind = TypeKind::Error;
    const ContainerSymbol* container = nullptr;

    static Type int_type() { return {TypeKind::Int, nullptr}; }
    static Type str_type() { return {TypeKind::Str, nullptr}; }
    static Type unit_type() { return {TypeKind::Unit, nullptr}; }
    static Type object_type(const ContainerSymbol* cls) { return {TypeKind::Object, cls}; }
    static Type namespace_type(const ContainerSymbol* c) { return {TypeKind::Namespace, c}; }

    bool is_value() const { return kind != TypeKind::Error && kind != TypeKind::Namespace; }

    bool operator==(const Type& other) const { return kind == other.kind && container == other.container; }
    bool operator!=(const Type& other) const { return !(*this == other); }

    std::string to_string() const;
};

} // namespace kiln::frontend
