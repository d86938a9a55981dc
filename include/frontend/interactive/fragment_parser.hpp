#pragma once

#include <string>
#include <vector>

#include "frontend/interactive/declaration.hpp"

namespace kiln::frontend::interactive {

struct ParseOutcome {
    enum class Kind {
        Declarations,
        Incomplete,
        Blank,
        ParseError,
    };

    Kind kind = Kind::Blank;
    std::vector<Decl> decls;
    // the buffered text when incomplete, the message on a parse error
    std::string text;
};

/**
 * FragmentParser
 *
 * Splits a fragment into top-level statements with the shared lexer and
 * classifies them. Only bracket structure is checked here; everything else
 * is left to the compiler. Bare expressions are bound to `res<line>`, or
 * `res<line>_<i>` when the fragment holds more than one.
 */
class FragmentParser {
public:
    ParseOutcome parse(const std::string& source, const std::string& line_id) const;
};

} // namespace kiln::frontend::interactive
