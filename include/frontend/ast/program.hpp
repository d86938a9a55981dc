#pragma once

#include <memory>
#include <vector>

#include "frontend/ast/members.hpp"

namespace kiln::frontend::ast {

// One compilation unit: top-level imports followed by modules and classes.
class Program : public Node {
public:
    std::vector<std::unique_ptr<ImportNode>> imports;
    std::vector<std::unique_ptr<ContainerNode>> items;

    Program() : Node(NodeType::Program) {}
};

} // namespace kiln::frontend::ast
