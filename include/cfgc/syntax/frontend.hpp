// cfgc/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "cfgc/ast/ast.hpp"
#include "cfgc/ast/ast_context.hpp"
#include "cfgc/basic/diagnostic.hpp"
#include "cfgc/basic/source_manager.hpp"

namespace cfgc
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  TranslationUnit * unit = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> trivia filter -> recursive-descent parser (AST)
//
// Tokens are copied into `ast` with interned text, so the returned tree stays
// valid as long as `ast` does. Problems are reported into `diags`; `unit` is
// always non-null when the file could be registered.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace cfgc
