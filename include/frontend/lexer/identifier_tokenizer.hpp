#pragma once

#include <cstddef>
#include <string>

#include "frontend/lexer/token.hpp"

namespace kiln::frontend {

Token tokenize_identifier_or_keyword(const std::string& input, std::size_t& pos, std::size_t line, std::size_t& column);

} // namespace kiln::frontend
