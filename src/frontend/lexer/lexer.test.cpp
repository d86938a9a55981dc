#include <iostream>
#include <string>
#include <vector>

#include "frontend/lexer/lexer.hpp"

using namespace kiln::frontend;

static int failures = 0;

static void expect(bool condition, const std::string& name, const std::string& detail = "") {
    if (!condition) {
        std::cerr << "FAIL(" << name << ")" << (detail.empty() ? "" : ": " + detail) << "\n";
        ++failures;
    }
}

static std::vector<TokenType> types_of(const std::string& source) {
    std::vector<TokenType> out;
    for (const auto& token : Lexer(source).tokenize()) {
        out.push_back(token.type);
    }
    return out;
}

static void test_keywords_and_operators() {
    auto types = types_of("lazy val x = a ++ b");
    std::vector<TokenType> expected = {
        TokenType::LAZY, TokenType::VAL, TokenType::IDENTIFIER, TokenType::ASSIGNMENT,
        TokenType::IDENTIFIER, TokenType::CONCAT, TokenType::IDENTIFIER, TokenType::EOF_TOKEN,
    };
    expect(types == expected, "keywords_and_operators");
}

static void test_newlines_collapse() {
    auto types = types_of("a\n\n\nb\n");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::NEWLINE, TokenType::IDENTIFIER, TokenType::NEWLINE, TokenType::EOF_TOKEN,
    };
    expect(types == expected, "newlines_collapse");
    expect(types_of("\n\nx").front() == TokenType::IDENTIFIER, "leading_newlines_dropped");
}

static void test_comments() {
    auto types = types_of("x // trailing words\ny");
    expect(types.size() == 4 && types[1] == TokenType::NEWLINE, "comments");
}

static void test_dollar_identifiers() {
    auto tokens = Lexer("cmd3$Main.$main").tokenize();
    expect(tokens.size() == 4, "dollar_identifiers.count");
    expect(tokens[0].lexeme == "cmd3$Main" && tokens[2].lexeme == "$main", "dollar_identifiers.lexemes");
}

static void test_strings() {
    auto tokens = Lexer("\"a\\\"b\\n\"").tokenize();
    expect(tokens[0].type == TokenType::STRING && tokens[0].lexeme == "a\"b\n", "string_escapes");

    bool threw = false;
    try {
        Lexer("\"open").tokenize();
    } catch (const LexError& e) {
        threw = true;
        expect(e.line == 1 && e.column == 1, "unclosed_string.position");
    }
    expect(threw, "unclosed_string");

    threw = false;
    try {
        Lexer("\"first\nsecond\"").tokenize();
    } catch (const LexError&) {
        threw = true;
    }
    expect(threw, "string_line_break");
}

static void test_positions() {
    auto tokens = Lexer("val x\n  = 10").tokenize();
    const Token& number = tokens[4];
    expect(number.type == TokenType::NUMBER && number.line == 2 && number.column_start == 5, "positions.number");
    expect(number.position_start == 10 && number.position_end == 12, "positions.offsets");
}

int main() {
    test_keywords_and_operators();
    test_newlines_collapse();
    test_comments();
    test_dollar_identifiers();
    test_strings();
    test_positions();

    if (failures) {
        std::cerr << failures << " lexer test(s) failed\n";
        return 1;
    }
    std::cout << "lexer tests passed\n";
    return 0;
}
