#include "frontend/interactive/fragment_parser.hpp"

#include <algorithm>

#include "frontend/lexer/lexer.hpp"

namespace kiln::frontend::interactive {

namespace {

struct Span {
    std::size_t begin;
    std::size_t end;
};

bool is_opener(TokenType type) {
    return type == TokenType::OPAREN || type == TokenType::OBRACE;
}

bool is_closer(TokenType type) {
    return type == TokenType::CPAREN || type == TokenType::CBRACE;
}

TokenType opener_of(TokenType closer) {
    return closer == TokenType::CPAREN ? TokenType::OPAREN : TokenType::OBRACE;
}

std::string position_text(const Token& token) {
    return std::to_string(token.line) + ":" + std::to_string(token.column_start);
}

// Top-level statements, as token ranges.
std::vector<Span> split_statements(const std::vector<Token>& tokens) {
    std::vector<Span> spans;
    constexpr std::size_t kNone = static_cast<std::size_t>(-1);
    std::size_t begin = kNone;
    int depth = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        bool separator = token.type == TokenType::SEMICOLON || token.type == TokenType::NEWLINE;
        if (depth == 0 && separator) {
            if (begin == kNone) continue;
            if (token.type == TokenType::NEWLINE) {
                if (is_continuation_token(tokens[i - 1].type)) continue;
                auto next = std::find_if(tokens.begin() + i + 1, tokens.end(),
                    [](const Token& t) { return t.type != TokenType::NEWLINE; });
                if (next != tokens.end() && (next->type == TokenType::ELSE || next->type == TokenType::DOT)) continue;
            }
            spans.push_back({begin, i});
            begin = kNone;
            continue;
        }

        if (begin == kNone) begin = i;
        if (is_opener(token.type)) ++depth;
        if (is_closer(token.type)) --depth;
    }
    if (begin != kNone) {
        spans.push_back({begin, tokens.size()});
    }
    return spans;
}

std::string import_path(const std::vector<Token>& tokens, std::size_t from, std::size_t to) {
    std::string path;
    for (std::size_t i = from; i < to; ++i) {
        switch (tokens[i].type) {
            case TokenType::COMMA: path += ", "; break;
            case TokenType::ARROW: path += " => "; break;
            case TokenType::NEWLINE: break;
            default: path += tokens[i].lexeme;
        }
    }
    return path;
}

bool is_expression_start(const std::vector<Token>& tokens, const Span& span) {
    std::size_t k = span.begin;
    while (k < span.end && (tokens[k].type == TokenType::IMPLICIT || tokens[k].type == TokenType::LAZY ||
                            tokens[k].type == TokenType::INLINE || tokens[k].type == TokenType::EXPORT)) {
        ++k;
    }
    if (k != span.begin) return false;
    switch (tokens[k].type) {
        case TokenType::VAL:
        case TokenType::DEF:
        case TokenType::EXTERN:
        case TokenType::CLASS:
        case TokenType::MODULE:
        case TokenType::IMPORT:
            return false;
        default:
            return true;
    }
}

} // namespace

ParseOutcome FragmentParser::parse(const std::string& source, const std::string& line_id) const {
    ParseOutcome out;

    std::vector<Token> tokens;
    try {
        Lexer lexer(source);
        tokens = lexer.tokenize();
    } catch (const LexError& e) {
        out.kind = ParseOutcome::Kind::ParseError;
        out.text = std::to_string(e.line) + ":" + std::to_string(e.column) + ": " + e.what();
        return out;
    }
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
        [](const Token& t) { return t.type == TokenType::EOF_TOKEN; }), tokens.end());

    bool blank = std::all_of(tokens.begin(), tokens.end(), [](const Token& t) {
        return t.type == TokenType::NEWLINE || t.type == TokenType::SEMICOLON;
    });
    if (blank) {
        out.kind = ParseOutcome::Kind::Blank;
        return out;
    }

    std::vector<TokenType> open;
    for (const auto& token : tokens) {
        if (is_opener(token.type)) {
            open.push_back(token.type);
        } else if (is_closer(token.type)) {
            if (open.empty() || open.back() != opener_of(token.type)) {
                out.kind = ParseOutcome::Kind::ParseError;
                out.text = position_text(token) + ": unexpected " + get_token_name(token.type);
                return out;
            }
            open.pop_back();
        }
    }

    auto last = std::find_if(tokens.rbegin(), tokens.rend(), [](const Token& t) { return t.type != TokenType::NEWLINE; });
    if (!open.empty() || is_continuation_token(last->type)) {
        out.kind = ParseOutcome::Kind::Incomplete;
        out.text = source;
        return out;
    }

    std::string line = line_id;
    std::replace(line.begin(), line.end(), '-', '_');

    std::vector<Span> spans = split_statements(tokens);
    std::size_t expressions = std::count_if(spans.begin(), spans.end(),
        [&](const Span& span) { return is_expression_start(tokens, span); });
    std::size_t expression_index = 0;

    for (const Span& span : spans) {
        Decl decl;
        const Token& first = tokens[span.begin];
        const Token& end = tokens[span.end - 1];
        std::string text = source.substr(first.position_start, end.position_end - first.position_start);

        for (std::size_t i = span.begin; i < span.end; ++i) {
            if (tokens[i].type == TokenType::IDENTIFIER && (i == span.begin || tokens[i - 1].type != TokenType::DOT)) {
                decl.referenced_names.insert(tokens[i].lexeme);
            }
        }

        if (is_expression_start(tokens, span)) {
            std::string name = "res" + line;
            if (expressions > 1) name += "_" + std::to_string(expression_index);
            ++expression_index;
            decl.code = "val " + name + " = " + text;
            decl.display.push_back(DisplayItem::identity(name));
            out.decls.push_back(std::move(decl));
            continue;
        }

        decl.code = text;
        std::size_t k = span.begin;
        bool lazy = false;
        while (tokens[k].type == TokenType::IMPLICIT || tokens[k].type == TokenType::LAZY ||
               tokens[k].type == TokenType::INLINE || tokens[k].type == TokenType::EXPORT) {
            lazy = lazy || tokens[k].type == TokenType::LAZY;
            ++k;
        }
        auto name_at = [&](std::size_t j) -> std::string {
            return j < span.end && tokens[j].type == TokenType::IDENTIFIER ? tokens[j].lexeme : "";
        };

        std::string name;
        switch (tokens[k].type) {
            case TokenType::VAL:
                name = name_at(k + 1);
                if (!name.empty()) {
                    decl.display.push_back(lazy ? DisplayItem::lazy_identity(name) : DisplayItem::identity(name));
                }
                break;
            case TokenType::DEF:
                name = name_at(k + 1);
                if (!name.empty()) decl.display.push_back(DisplayItem::definition("function", name));
                break;
            case TokenType::EXTERN:
                name = name_at(k + 2);
                if (!name.empty()) decl.display.push_back(DisplayItem::definition("function", name));
                break;
            case TokenType::CLASS:
            case TokenType::MODULE:
                name = name_at(k + 1);
                if (!name.empty()) {
                    decl.display.push_back(DisplayItem::definition(tokens[k].type == TokenType::CLASS ? "class" : "module", name));
                }
                break;
            case TokenType::IMPORT:
                decl.display.push_back(DisplayItem::import(import_path(tokens, k + 1, span.end)));
                break;
            default:
                break;
        }
        out.decls.push_back(std::move(decl));
    }

    out.kind = ParseOutcome::Kind::Declarations;
    return out;
}

} // namespace kiln::frontend::interactive
