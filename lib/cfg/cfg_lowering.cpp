// cfgc/cfg/cfg_lowering.cpp - AST to CFG lowering
#include "cfgc/cfg/cfg_lowering.hpp"

#include <string>
#include <utility>

#include "cfgc/basic/casting.hpp"

namespace cfgc
{

// ============================================================================
// Token spelling
// ============================================================================

std::vector<std::string> spell_tokens(TokenSpan tokens)
{
  std::vector<std::string> out;
  out.reserve(tokens.size());
  for (const auto & t : tokens) {
    out.push_back(std::string(t.text) + " ");
  }
  return out;
}

std::vector<Fragment> make_statement_line(TokenSpan tokens)
{
  std::vector<Fragment> line;
  line.reserve(tokens.size() + 2);
  line.push_back(Fragment::make_stmt_start());
  for (auto & text : spell_tokens(tokens)) {
    line.push_back(Fragment::make_text(std::move(text)));
  }
  line.push_back(Fragment::make_text("\n"));
  return line;
}

// ============================================================================
// Entry Points
// ============================================================================

Program CfgLowering::lower(const TranslationUnit & unit)
{
  Program program;

  for (const VarDecl * decl : unit.globals) {
    if (decl == nullptr) {
      continue;
    }
    for (auto & f : make_statement_line(decl->get_tokens())) {
      program.globals.fragments.push_back(std::move(f));
    }
  }

  for (const FunctionDecl * fn : unit.functions) {
    if (fn != nullptr) {
      program.functions.push_back(lower_function(*fn));
    }
  }
  return program;
}

Cfg CfgLowering::lower_function(const FunctionDecl & fn)
{
  Cfg cfg{std::string(fn.name)};
  cfg.return_type.push_back(std::string(fn.return_type) + " ");
  cfg.params = spell_tokens(fn.param_tokens);

  GraphBuilder builder(cfg);
  builder_ = &builder;
  lower_compound(fn.body);
  builder_ = nullptr;

  return cfg;
}

Program lower_translation_unit(const TranslationUnit & unit) { return CfgLowering{}.lower(unit); }

// ============================================================================
// Emission
// ============================================================================

void CfgLowering::emit(Fragment fragment) { builder_->append(std::move(fragment)); }

void CfgLowering::emit_tokens(TokenSpan tokens)
{
  for (auto & text : spell_tokens(tokens)) {
    emit(Fragment::make_text(std::move(text)));
  }
}

void CfgLowering::emit_line(TokenSpan tokens)
{
  for (auto & f : make_statement_line(tokens)) {
    emit(std::move(f));
  }
}

void CfgLowering::emit_header_start(ControlKeyword kw)
{
  emit(Fragment::make_stmt_start());
  emit(Fragment::make_keyword(kw));
  emit(Fragment::make_text("( "));
}

// ============================================================================
// Statements
// ============================================================================

void CfgLowering::lower_stmt(const Stmt * stmt)
{
  if (stmt == nullptr) {
    return;
  }

  switch (stmt->get_kind()) {
    case NodeKind::CompoundStmt:
      lower_compound(cast<CompoundStmt>(stmt));
      return;

    case NodeKind::IfStmt:
      lower_if(cast<IfStmt>(stmt));
      return;

    case NodeKind::WhileStmt:
      lower_while(cast<WhileStmt>(stmt));
      return;

    case NodeKind::ForStmt:
      lower_for(cast<ForStmt>(stmt));
      return;

    case NodeKind::ReturnStmt:
      lower_return(cast<ReturnStmt>(stmt));
      return;

    case NodeKind::AssignStmt:
    case NodeKind::CallStmt:
    case NodeKind::EmptyStmt:
      emit_line(stmt->get_tokens());
      return;

    default:
      return;
  }
}

void CfgLowering::lower_compound(const CompoundStmt * block)
{
  if (block == nullptr) {
    return;
  }
  for (const VarDecl * decl : block->decls) {
    if (decl != nullptr) {
      emit_line(decl->get_tokens());
    }
  }
  for (const Stmt * s : block->stmts) {
    lower_stmt(s);
  }
}

void CfgLowering::lower_return(const ReturnStmt * stmt)
{
  emit_line(stmt->get_tokens());
  builder_->seal_to_exit();
}

void CfgLowering::lower_if(const IfStmt * stmt)
{
  emit_header_start(ControlKeyword::If);
  if (stmt->condition != nullptr) {
    emit_tokens(stmt->condition->get_tokens());
  }
  emit(Fragment::make_text(") "));

  ScopeGuard branch = builder_->open_branch_scope();
  if (!branch) {
    return;
  }

  builder_->reset_to_scope_start();
  Cfg & cfg = builder_->cfg();
  const BlockId if_block = builder_->current();

  const BlockId then_block = builder_->advance();
  cfg.block(if_block).then_target = then_block;
  lower_stmt(stmt->then_stmt);

  builder_->reset_to_scope_start();
  const BlockId else_block = builder_->advance();
  cfg.block(if_block).else_target = else_block;
  lower_stmt(stmt->else_stmt);

  branch.close();
}

void CfgLowering::lower_while(const WhileStmt * stmt)
{
  ScopeGuard loop = builder_->open_loop_scope();
  if (!loop) {
    return;
  }

  emit_header_start(ControlKeyword::While);
  if (stmt->condition != nullptr) {
    emit_tokens(stmt->condition->get_tokens());
  }
  emit(Fragment::make_text(") "));

  builder_->advance();
  lower_stmt(stmt->body);
  loop.close();

  const BlockId header = builder_->current();
  const BlockId loop_exit = builder_->advance();
  builder_->cfg().block(header).loop_exit = loop_exit;
}

void CfgLowering::lower_for(const ForStmt * stmt)
{
  // The initializer runs once, before the loop header.
  emit(Fragment::make_stmt_start());
  if (stmt->init != nullptr) {
    emit_tokens(stmt->init->get_tokens());
  }
  emit(Fragment::make_text("; "));
  emit(Fragment::make_text("\n"));

  ScopeGuard loop = builder_->open_loop_scope();
  if (!loop) {
    return;
  }

  emit_header_start(ControlKeyword::For);
  emit(Fragment::make_text("; "));
  if (stmt->condition != nullptr) {
    emit_tokens(stmt->condition->get_tokens());
  }
  emit(Fragment::make_text("; "));
  emit(Fragment::make_text(") "));

  builder_->advance();

  // The update gets its own block between the body and the header.
  ScopeGuard update = builder_->open_branch_scope();
  if (!update) {
    return;
  }
  emit(Fragment::make_stmt_start());
  if (stmt->update != nullptr) {
    emit_tokens(stmt->update->get_tokens());
  }
  emit(Fragment::make_text("; "));
  emit(Fragment::make_text("\n"));

  builder_->reset_to_scope_start();
  lower_stmt(stmt->body);

  update.close();
  loop.close();

  const BlockId header = builder_->current();
  const BlockId loop_exit = builder_->advance();
  builder_->cfg().block(header).loop_exit = loop_exit;
}

}  // namespace cfgc
