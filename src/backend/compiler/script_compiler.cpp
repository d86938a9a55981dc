#include "backend/compiler/script_compiler.hpp"

#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include "backend/codegen/generate_ir.hpp"
#include "frontend/checker/typer.hpp"
#include "frontend/compile_error.hpp"
#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"

namespace kiln::backend::compiler {

using frontend::interactive::ImportEntry;
namespace ast = frontend::ast;

namespace {

ImportEntry member_export(const std::string& name, bool implicit) {
    ImportEntry entry;
    entry.local = name;
    entry.source = name;
    entry.implicit = implicit;
    return entry;
}

void export_import(const ast::ImportNode& node, std::vector<ImportEntry>& out) {
    for (const auto& selector : node.selectors) {
        ImportEntry entry;
        entry.local = selector.alias;
        entry.source = selector.name;
        entry.prefix = node.resolved_prefix;
        entry.relative = node.relative_prefix;
        entry.implicit = selector.implicit;
        out.push_back(entry);
    }
    if (node.wildcard) {
        ImportEntry entry = frontend::interactive::wildcard_import(node.resolved_prefix);
        entry.relative = node.relative_prefix;
        out.push_back(entry);
    }
}

} // namespace

std::vector<ImportEntry> collect_exports(const ast::Program& program) {
    std::vector<ImportEntry> out;
    for (const auto& item : program.items) {
        if (!item->exported) continue;

        for (const auto& member : item->members) {
            switch (member->kind) {
                case ast::NodeType::Val: {
                    const auto& val = static_cast<const ast::ValNode&>(*member);
                    out.push_back(member_export(val.name, val.implicit));
                    break;
                }
                case ast::NodeType::Def: {
                    const auto& def = static_cast<const ast::DefNode&>(*member);
                    out.push_back(member_export(def.name, def.implicit));
                    break;
                }
                case ast::NodeType::Extern:
                    out.push_back(member_export(static_cast<const ast::ExternNode&>(*member).name, false));
                    break;
                case ast::NodeType::Container:
                    out.push_back(member_export(static_cast<const ast::ContainerNode&>(*member).name, false));
                    break;
                case ast::NodeType::Import:
                    export_import(static_cast<const ast::ImportNode&>(*member), out);
                    break;
                default:
                    break;
            }
        }
    }
    return out;
}

ScriptCompiler::ScriptCompiler(registry::ArtifactRegistry& registry) : registry_(registry) {
    // compile-time output is not part of the session's output
    inline_context_.set_output([](const std::string&) {});
}

void ScriptCompiler::reset() {
    symbols_.reset();
}

std::optional<std::int64_t> ScriptCompiler::evaluate_inline(const ast::Expr& init, std::string& error) {
    auto loader = registry_.current_loader(registry::ClassLoaderTier::CompilerInternal);
    if (!loader) {
        error = llvm::toString(loader.takeError());
        return std::nullopt;
    }

    std::string entry = "$inline$" + std::to_string(next_probe_++);
    auto context = std::make_unique<llvm::LLVMContext>();
    std::unique_ptr<llvm::Module> module;
    try {
        module = codegen::generate_probe(init, entry, *context);
    } catch (const frontend::CompileError& e) {
        error = e.what();
        return std::nullopt;
    }

    runtime::RuntimeScope scope(inline_context_);
    auto value = (*loader)->evaluate(llvm::orc::ThreadSafeModule(std::move(module), std::move(context)), entry);
    if (!value) {
        error = llvm::toString(value.takeError());
        return std::nullopt;
    }
    return *value;
}

bool ScriptCompiler::extern_visible(const std::string& symbol) {
    auto loader = registry_.current_loader(registry::ClassLoaderTier::Runtime);
    if (!loader) {
        llvm::consumeError(loader.takeError());
        return false;
    }
    return (*loader)->has_symbol(symbol);
}

std::optional<CompileOutput> ScriptCompiler::compile(const std::string& source, DiagnosticSink& sink) {
    try {
        frontend::Lexer lexer(source);
        std::vector<frontend::Token> tokens = lexer.tokenize();

        frontend::Parser parser;
        std::unique_ptr<ast::Program> program = parser.produce_ast(tokens);

        frontend::Typer typer(
            symbols_,
            [this](const ast::Expr& init, std::string& error) { return evaluate_inline(init, error); },
            [this](const std::string& symbol) { return extern_visible(symbol); });
        auto containers = typer.check(*program);

        llvm::LLVMContext context;
        std::vector<codegen::GeneratedModule> modules = codegen::generate_program(*program, context);

        CompileOutput output;
        for (auto& generated : modules) {
            std::string problems;
            llvm::raw_string_ostream verify_out(problems);
            if (llvm::verifyModule(*generated.module, &verify_out)) {
                sink.report(make_diagnostic(source, 0, 0, "invalid code generated for " + generated.name + ": " + verify_out.str()));
                return std::nullopt;
            }

            std::string bytes;
            llvm::raw_string_ostream bitcode(bytes);
            llvm::WriteBitcodeToFile(*generated.module, bitcode);
            bitcode.flush();
            output.artifacts.push_back({generated.name, std::move(bytes), source});
        }
        output.exported = collect_exports(*program);

        symbols_.commit(containers);
        return output;
    } catch (const frontend::LexError& e) {
        sink.report(make_diagnostic(source, e.line, e.column, e.what()));
    } catch (const frontend::CompileError& e) {
        sink.report(make_diagnostic(source, e.line, e.column, e.what()));
    }
    return std::nullopt;
}

} // namespace kiln::backend::compiler
