#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>

#include "backend/compiler/script_compiler.hpp"
#include "frontend/compile_error.hpp"
#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"

namespace kiln::backend::compiler {

namespace {

const char* const kKeywords[] = {
    "class", "def", "else", "export", "extern", "if", "implicit", "import",
    "inline", "lazy", "module", "new", "this", "val",
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::vector<std::string> split_path(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = text.find('.', start);
        out.push_back(text.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return out;
}

// local name -> "prefix.source" for every named import of the preamble
std::map<std::string, std::string> preamble_bindings(const std::string& preamble, std::vector<std::string>& wildcards) {
    std::map<std::string, std::string> bindings;
    try {
        frontend::Lexer lexer(preamble);
        frontend::Parser parser;
        auto program = parser.produce_ast(lexer.tokenize());
        for (const auto& import : program->imports) {
            for (const auto& selector : import->selectors) {
                bindings[selector.alias] = import->prefix_text() + "." + selector.name;
            }
            if (import->wildcard) {
                wildcards.push_back(import->prefix_text());
            }
        }
    } catch (const std::runtime_error&) {
        // lex and parse errors; completion then works without the preamble
    }
    return bindings;
}

} // namespace

Completion ScriptCompiler::complete(std::size_t cursor, const std::string& preamble, const std::string& text) {
    cursor = std::min(cursor, text.size());
    std::size_t start = cursor;
    while (start > 0 && is_word_char(text[start - 1])) {
        --start;
    }
    std::string prefix = text.substr(start, cursor - start);

    std::vector<std::string> wildcards;
    std::map<std::string, std::string> bindings = preamble_bindings(preamble, wildcards);

    // Walks a dotted path to the module or class whose members it names.
    std::function<const frontend::ContainerSymbol*(const std::vector<std::string>&, int)> resolve =
        [&](const std::vector<std::string>& path, int depth) -> const frontend::ContainerSymbol* {
        if (path.empty() || depth > 8) return nullptr;

        const frontend::ContainerSymbol* current = nullptr;
        auto bound = bindings.find(path.front());
        if (bound != bindings.end()) {
            std::vector<std::string> expanded = split_path(bound->second);
            expanded.insert(expanded.end(), path.begin() + 1, path.end());
            return resolve(expanded, depth + 1);
        }
        auto global = symbols_.find_global(path.front());
        if (!global) return nullptr;
        current = global.get();

        for (std::size_t i = 1; i < path.size() && current; ++i) {
            const frontend::MemberSymbol* member = current->find(path[i]);
            if (!member) return nullptr;
            if (member->nested) {
                current = member->nested.get();
            } else if (member->type.kind == frontend::TypeKind::Object) {
                current = member->type.container;
            } else {
                return nullptr;
            }
        }
        return current;
    };

    std::set<std::string> names;
    if (start > 0 && text[start - 1] == '.') {
        std::size_t path_start = start - 1;
        while (path_start > 0 && (is_word_char(text[path_start - 1]) || text[path_start - 1] == '.')) {
            --path_start;
        }
        std::vector<std::string> path = split_path(text.substr(path_start, start - 1 - path_start));
        if (const frontend::ContainerSymbol* container = resolve(path, 0)) {
            for (const auto& member : container->members) {
                names.insert(member->name);
            }
        }
    } else {
        for (const auto& binding : bindings) {
            names.insert(binding.first);
        }
        for (const auto& wildcard : wildcards) {
            if (const frontend::ContainerSymbol* container = resolve(split_path(wildcard), 0)) {
                for (const auto& member : container->members) {
                    names.insert(member->name);
                }
            }
        }
        for (const auto& global : symbols_.global_names()) {
            auto symbol = symbols_.find_global(global);
            if (symbol && registry_.lookup_artifact(symbol->artifact)) {
                names.insert(global);
            }
        }
        for (const char* keyword : kKeywords) {
            names.insert(keyword);
        }
    }

    Completion completion;
    completion.start = start;
    for (const auto& name : names) {
        if (name.compare(0, prefix.size(), prefix) == 0 && name.find('$') == std::string::npos) {
            completion.candidates.push_back(name);
        }
    }
    return completion;
}

} // namespace kiln::backend::compiler
