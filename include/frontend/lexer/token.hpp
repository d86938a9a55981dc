#pragma once

#include <cstddef>
#include <string>

namespace kiln::frontend {

enum class TokenType {
    IDENTIFIER,
    NUMBER,
    STRING,

    VAL,
    LAZY,
    INLINE,
    IMPLICIT,
    DEF,
    EXTERN,
    CLASS,
    MODULE,
    EXPORT,
    IMPORT,
    NEW,
    THIS,
    IF,
    ELSE,

    PLUS,
    MINUS,
    MUL,
    DIV,
    MOD,
    CONCAT,
    EQUALS,
    DIFFERENT,
    LT,
    GT,
    LESS_THAN_EQUALS,
    GREATER_THAN_EQUALS,
    AND,
    OR,
    NOT,
    ASSIGNMENT,
    ARROW,
    DOT,
    COMMA,
    COLON,
    SEMICOLON,
    OPAREN,
    CPAREN,
    OBRACE,
    CBRACE,

    NEWLINE,
    EOF_TOKEN,
};

inline const char* get_token_name(TokenType type) {
    switch (type) {
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::NUMBER: return "number";
        case TokenType::STRING: return "string literal";
        case TokenType::VAL: return "'val'";
        case TokenType::LAZY: return "'lazy'";
        case TokenType::INLINE: return "'inline'";
        case TokenType::IMPLICIT: return "'implicit'";
        case TokenType::DEF: return "'def'";
        case TokenType::EXTERN: return "'extern'";
        case TokenType::CLASS: return "'class'";
        case TokenType::MODULE: return "'module'";
        case TokenType::EXPORT: return "'export'";
        case TokenType::IMPORT: return "'import'";
        case TokenType::NEW: return "'new'";
        case TokenType::THIS: return "'this'";
        case TokenType::IF: return "'if'";
        case TokenType::ELSE: return "'else'";
        case TokenType::PLUS: return "'+'";
        case TokenType::MINUS: return "'-'";
        case TokenType::MUL: return "'*'";
        case TokenType::DIV: return "'/'";
        case TokenType::MOD: return "'%'";
        case TokenType::CONCAT: return "'++'";
        case TokenType::EQUALS: return "'=='";
        case TokenType::DIFFERENT: return "'!='";
        case TokenType::LT: return "'<'";
        case TokenType::GT: return "'>'";
        case TokenType::LESS_THAN_EQUALS: return "'<='";
        case TokenType::GREATER_THAN_EQUALS: return "'>='";
        case TokenType::AND: return "'&&'";
        case TokenType::OR: return "'||'";
        case TokenType::NOT: return "'!'";
        case TokenType::ASSIGNMENT: return "'='";
        case TokenType::ARROW: return "'=>'";
        case TokenType::DOT: return "'.'";
        case TokenType::COMMA: return "','";
        case TokenType::COLON: return "':'";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::OPAREN: return "'('";
        case TokenType::CPAREN: return "')'";
        case TokenType::OBRACE: return "'{'";
        case TokenType::CBRACE: return "'}'";
        case TokenType::NEWLINE: return "newline";
        case TokenType::EOF_TOKEN: return "end of input";
    }
    return "unknown";
}

// Binary operators and separators after which a statement cannot end.
inline bool is_continuation_token(TokenType type) {
    switch (type) {
        case TokenType::PLUS:
        case TokenType::MINUS:
        case TokenType::MUL:
        case TokenType::DIV:
        case TokenType::MOD:
        case TokenType::CONCAT:
        case TokenType::EQUALS:
        case TokenType::DIFFERENT:
        case TokenType::LT:
        case TokenType::GT:
        case TokenType::LESS_THAN_EQUALS:
        case TokenType::GREATER_THAN_EQUALS:
        case TokenType::AND:
        case TokenType::OR:
        case TokenType::NOT:
        case TokenType::ASSIGNMENT:
        case TokenType::ARROW:
        case TokenType::DOT:
        case TokenType::COMMA:
        case TokenType::COLON:
        case TokenType::VAL:
        case TokenType::LAZY:
        case TokenType::INLINE:
        case TokenType::IMPLICIT:
        case TokenType::DEF:
        case TokenType::EXTERN:
        case TokenType::CLASS:
        case TokenType::MODULE:
        case TokenType::EXPORT:
        case TokenType::IMPORT:
        case TokenType::NEW:
        case TokenType::IF:
        case TokenType::ELSE:
            return true;
        default:
            return false;
    }
}

struct Token {
    TokenType type;
    std::string lexeme;
    std::size_t line;
    std::size_t column_start;
    std::size_t column_end;
    std::size_t position_start;
    std::size_t position_end;

    Token(TokenType t, std::string l, std::size_t li, std::size_t cs, std::size_t ce, std::size_t ps, std::size_t pe)
        : type(t), lexeme(std::move(l)), line(li), column_start(cs), column_end(ce), position_start(ps), position_end(pe) {}
};

} // namespace kiln::frontend
