// cfgc/syntax/frontend.cpp - High-level parse pipeline
#include "cfgc/syntax/frontend.hpp"

#include <vector>

#include "cfgc/syntax/lexer.hpp"
#include "cfgc/syntax/parser.hpp"

namespace cfgc
{

namespace
{

constexpr size_t k_max_lexical_diags = 64;

}  // namespace

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "too many source files registered")
      .with_help(path.string() + " could not be loaded");
    return out;
  }

  syntax::Lexer lexer(out.file_id, file->content());
  const std::vector<syntax::Token> raw = lexer.lex_all();

  std::vector<syntax::Token> tokens;
  tokens.reserve(raw.size());
  size_t reported = 0;
  for (const auto & t : raw) {
    if (t.is_trivia()) {
      continue;
    }
    if (t.kind == syntax::TokenKind::Unknown) {
      if (reported++ < k_max_lexical_diags) {
        if (t.text == "/*") {
          diags.report_error(t.range, "unterminated block comment", "comment starts here")
            .with_help("close the comment with `*/`");
        } else {
          diags.report_error(t.range, "unexpected character '" + std::string(t.text) + "'");
        }
      }
      continue;
    }
    syntax::Token copy = t;
    copy.text = ast.intern(t.text);
    tokens.push_back(copy);
  }

  const gsl::span<syntax::Token> stored = ast.copy_to_arena(tokens);
  syntax::Parser parser(ast, *file, diags, stored);
  out.unit = parser.parse_translation_unit();
  return out;
}

}  // namespace cfgc
