#pragma once

#include <cstddef>
#include <string>

#include "frontend/lexer/token.hpp"

namespace kiln::frontend {

Token tokenize_number(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column);

} // namespace kiln::frontend
