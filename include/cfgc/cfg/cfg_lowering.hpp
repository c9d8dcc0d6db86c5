// cfgc/cfg/cfg_lowering.hpp - AST to CFG lowering
//
// Walks a parsed translation unit in source order and drives GraphBuilder.
// File-scope declarations go to the Global list; every function gets its own
// graph.
//
#pragma once

#include <string>
#include <vector>

#include "cfgc/ast/ast.hpp"
#include "cfgc/cfg/cfg.hpp"
#include "cfgc/cfg/graph_builder.hpp"

namespace cfgc
{

/**
 * Lowers simpleC statements to graph construction events.
 *
 * Each source token is emitted as its spelling plus one space. A statement
 * line is a StmtStart fragment, its tokens and a newline. Control headers
 * are emitted without their newline so the renderer can annotate them:
 *
 * ```
 *     if( x > 0 )
 *     while( i < n )
 *     for( ; i < n ; )
 * ```
 *
 * Braces and `else` are never emitted.
 *
 * The tree must be free of parse errors.
 */
class CfgLowering
{
public:
  CfgLowering() = default;

  /// Lower a whole translation unit. Graphs are returned unpruned.
  [[nodiscard]] Program lower(const TranslationUnit & unit);

  /// Lower one function into a fresh graph.
  [[nodiscard]] Cfg lower_function(const FunctionDecl & fn);

private:
  // ===========================================================================
  // Statements
  // ===========================================================================

  void lower_stmt(const Stmt * stmt);
  void lower_compound(const CompoundStmt * block);
  void lower_if(const IfStmt * stmt);
  void lower_while(const WhileStmt * stmt);
  void lower_for(const ForStmt * stmt);
  void lower_return(const ReturnStmt * stmt);

  // ===========================================================================
  // Emission helpers
  // ===========================================================================

  void emit(Fragment fragment);
  void emit_tokens(TokenSpan tokens);
  void emit_line(TokenSpan tokens);

  /// StmtStart, keyword and `( `. The caller emits the rest of the header.
  void emit_header_start(ControlKeyword kw);

  GraphBuilder * builder_ = nullptr;
};

/// Tokens of `tokens` as `"<spelling> "` strings.
[[nodiscard]] std::vector<std::string> spell_tokens(TokenSpan tokens);

/// Statement-line fragments for a declaration or simple statement.
[[nodiscard]] std::vector<Fragment> make_statement_line(TokenSpan tokens);

/// Convenience wrapper: CfgLowering{}.lower(unit).
[[nodiscard]] Program lower_translation_unit(const TranslationUnit & unit);

}  // namespace cfgc
