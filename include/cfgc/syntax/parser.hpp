#pragma once

#include <gsl/span>
#include <string_view>
#include <vector>

#include "cfgc/ast/ast.hpp"
#include "cfgc/ast/ast_context.hpp"
#include "cfgc/basic/diagnostic.hpp"
#include "cfgc/basic/source_manager.hpp"
#include "cfgc/syntax/token.hpp"

namespace cfgc::syntax
{

enum class RecoverySet : uint32_t {
  None = 0,
  Statement = 1 << 0,  // ;
  Block = 1 << 1,      // } or ;
  Argument = 1 << 2,   // ) or ; or {
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Recursive-descent parser for simpleC.
 *
 * `tokens` must be trivia-free, end with Eof and live in the AstContext: node
 * token spans point straight into it.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceFile & source, DiagnosticBag & diags,
    gsl::span<const Token> tokens)
  : ast_(ast), source_(source), diags_(diags), tokens_(tokens)
  {
  }

  [[nodiscard]] TranslationUnit * parse_translation_unit();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();
  void synchronize_to_top_level();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool at_type_keyword() const;
  [[nodiscard]] bool at_decl_start() const;

  /// Tokens consumed since index `start`, and their joined range.
  [[nodiscard]] TokenSpan tokens_since(size_t start) const;
  [[nodiscard]] SourceRange range_since(size_t start) const;

  // Declarations
  [[nodiscard]] VarDecl * parse_var_decl();
  [[nodiscard]] Declarator * parse_declarator();
  [[nodiscard]] FunctionDecl * parse_function_decl();
  [[nodiscard]] ParamDecl * parse_param_decl();
  [[nodiscard]] bool at_function_start() const;

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] CompoundStmt * parse_compound_stmt();
  [[nodiscard]] AssignStmt * parse_assign(bool with_semicolon);
  [[nodiscard]] Stmt * parse_call_stmt();
  [[nodiscard]] Stmt * parse_return_stmt();
  [[nodiscard]] Stmt * parse_if_stmt();
  [[nodiscard]] Stmt * parse_while_stmt();
  [[nodiscard]] Stmt * parse_for_stmt();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] CallExpr * parse_call_expr();

  [[nodiscard]] Expr * make_binary(Expr * lhs, BinaryOp op, Expr * rhs, size_t start);
  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  gsl::span<const Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace cfgc::syntax
