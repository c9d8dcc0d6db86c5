#include "cfgc/syntax/parser.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>

#include "cfgc/syntax/keywords.hpp"

namespace cfgc::syntax
{
namespace
{

std::optional<int64_t> parse_int(std::string_view text)
{
  int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return v;
}

bool is_statement_keyword(const Token & t)
{
  if (t.kind != TokenKind::Identifier) return false;
  return t.text == "if" || t.text == "while" || t.text == "for" || t.text == "return";
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_[tokens_.size() - 1];
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  const std::string message = "expected " + std::string(what);

  if (k == TokenKind::Semicolon && idx_ > 0) {
    // A missing ';' is reported at the end of the previous token, where the
    // user has to type it, rather than at the start of the next line.
    const Token & last = prev();
    const SourceRange insert_at(last.range.file_id(), last.end(), last.end());
    diags_.report_error(last.range, message, "expected `;` after this")
      .with_code("P001")
      .with_fixit(insert_at, ";");
  } else {
    error_at(cur(), message);
  }

  if (recovery == RecoverySet::None) {
    return false;
  }

  while (!at_eof()) {
    if (match(k)) {
      return true;
    }

    const TokenKind kind = cur().kind;
    if (kind == TokenKind::Semicolon) {
      // The statement ends here; swallow the ';' so the caller starts fresh.
      advance();
      return false;
    }
    // Never skip past the end of the enclosing block.
    if (kind == TokenKind::RBrace) {
      return false;
    }
    if ((kind == TokenKind::RParen || kind == TokenKind::LBrace) &&
        (recovery & RecoverySet::Argument)) {
      return false;
    }
    advance();
  }
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg));
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace) || at(TokenKind::LBrace)) {
      return;
    }
    if (is_statement_keyword(cur()) || at_type_keyword()) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_top_level()
{
  // Skip to the next type keyword outside any braces.
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RBrace)) {
      if (depth > 0) --depth;
    } else if (depth == 0 && at_type_keyword()) {
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::at_type_keyword() const
{
  return cur().kind == TokenKind::Identifier && is_type_keyword(cur().text);
}

bool Parser::at_decl_start() const { return at_type_keyword() && !at_function_start(); }

bool Parser::at_function_start() const
{
  return at_type_keyword() && cur(1).kind == TokenKind::Identifier &&
         cur(2).kind == TokenKind::LParen;
}

TokenSpan Parser::tokens_since(size_t start) const
{
  if (idx_ <= start) {
    return {};
  }
  return tokens_.subspan(start, idx_ - start);
}

SourceRange Parser::range_since(size_t start) const
{
  if (idx_ <= start) {
    const auto at_loc = cur().range.get_begin();
    return {at_loc, at_loc};
  }
  return {tokens_[start].range.get_begin(), tokens_[idx_ - 1].range.get_end()};
}

// ============================================================================
// Top level
// ============================================================================

TranslationUnit * Parser::parse_translation_unit()
{
  const size_t start = idx_;
  const size_t errors_before = diags_.count(Severity::Error);

  std::vector<VarDecl *> globals;
  std::vector<FunctionDecl *> functions;

  while (!at_eof()) {
    if (at_function_start()) {
      if (auto * fn = parse_function_decl()) {
        functions.push_back(fn);
      }
      continue;
    }

    if (at_type_keyword()) {
      auto * decl = parse_var_decl();
      if (decl == nullptr) {
        continue;
      }
      if (!functions.empty()) {
        diags_
          .report_error(
            decl->get_range(), "global declaration after a function definition",
            "declared here")
          .with_secondary_label(functions.front()->get_range(), "first function defined here")
          .with_help("move global declarations above the first function definition");
      }
      globals.push_back(decl);
      continue;
    }

    if (is_statement_keyword(cur()) || is_kw("else", cur())) {
      diags_
        .report_error(
          cur().range, "statement outside of a function",
          "'" + std::string(cur().text) + "' is only allowed inside a function body")
        .with_help("wrap statements in a function such as `int main() { ... }`");
      advance();
      synchronize_to_top_level();
      continue;
    }

    error_at(cur(), "expected a declaration or function definition");
    advance();
    synchronize_to_top_level();
  }

  if (functions.empty() && diags_.count(Severity::Error) == errors_before) {
    diags_.report_error(cur().range, "expected at least one function definition")
      .with_help("a simpleC program needs a function, for example `int main() { return 0; }`");
  }

  auto * unit = ast_.create<TranslationUnit>(
    SourceRange(tokens_[0].range.file_id(), 0, static_cast<uint32_t>(source_.size())),
    tokens_since(start));
  unit->globals = ast_.copy_to_arena(globals);
  unit->functions = ast_.copy_to_arena(functions);
  return unit;
}

// ============================================================================
// Declarations
// ============================================================================

VarDecl * Parser::parse_var_decl()
{
  const size_t start = idx_;
  const Token & type_tok = advance();

  std::vector<Declarator *> declarators;
  do {
    auto * d = parse_declarator();
    if (d == nullptr) {
      synchronize_to_stmt();
      return nullptr;
    }
    declarators.push_back(d);
  } while (match(TokenKind::Comma));

  expect(TokenKind::Semicolon, "';' after declaration", RecoverySet::Statement);

  return ast_.create<VarDecl>(
    ast_.intern(type_tok.text), ast_.copy_to_arena(declarators), range_since(start),
    tokens_since(start));
}

Declarator * Parser::parse_declarator()
{
  const size_t start = idx_;
  if (!at(TokenKind::Identifier) || is_reserved_word(cur().text)) {
    error_at(cur(), "expected variable name in declaration");
    return nullptr;
  }
  const Token & name = advance();

  std::optional<int64_t> size;
  if (match(TokenKind::LBracket)) {
    const Token & size_tok = cur();
    if (match(TokenKind::IntLiteral)) {
      size = parse_int(size_tok.text);
      if (!size) {
        diags_.report_error(size_tok.range, "array size does not fit in 64 bits");
      }
    } else {
      error_at(cur(), "expected integer array size");
    }
    expect(TokenKind::RBracket, "']' after array size");
  }

  return ast_.create<Declarator>(
    ast_.intern(name.text), size, range_since(start), tokens_since(start));
}

FunctionDecl * Parser::parse_function_decl()
{
  const size_t start = idx_;
  const Token & ret = advance();
  const Token & name = advance();
  advance();  // '('

  std::vector<ParamDecl *> params;
  const size_t params_start = idx_;
  if (!at(TokenKind::RParen)) {
    do {
      auto * p = parse_param_decl();
      if (p == nullptr) {
        break;
      }
      params.push_back(p);
    } while (match(TokenKind::Comma));
  }
  const TokenSpan param_tokens = tokens_since(params_start);

  if (!expect(TokenKind::RParen, "')' after parameter list", RecoverySet::Argument) &&
      !at(TokenKind::LBrace)) {
    synchronize_to_top_level();
    return nullptr;
  }

  if (!at(TokenKind::LBrace)) {
    diags_.report_error(cur().range, "expected '{' to start the function body")
      .with_secondary_label(name.range, "function declared here")
      .with_help("simpleC has no prototypes; every function needs a body");
    synchronize_to_top_level();
    return nullptr;
  }

  CompoundStmt * body = parse_compound_stmt();

  auto * fn = ast_.create<FunctionDecl>(
    ast_.intern(ret.text), ast_.intern(name.text), range_since(start), tokens_since(start));
  fn->params = ast_.copy_to_arena(params);
  fn->param_tokens = param_tokens;
  fn->body = body;
  return fn;
}

ParamDecl * Parser::parse_param_decl()
{
  const size_t start = idx_;
  if (!at_type_keyword()) {
    error_at(cur(), "expected parameter type");
    return nullptr;
  }
  const Token & type_tok = advance();

  if (!at(TokenKind::Identifier) || is_reserved_word(cur().text)) {
    error_at(cur(), "expected parameter name");
    return nullptr;
  }
  const Token & name = advance();

  bool is_array = false;
  if (match(TokenKind::LBracket)) {
    expect(TokenKind::RBracket, "']' in array parameter");
    is_array = true;
  }

  return ast_.create<ParamDecl>(
    ast_.intern(type_tok.text), ast_.intern(name.text), is_array, range_since(start),
    tokens_since(start));
}

// ============================================================================
// Statements
// ============================================================================

CompoundStmt * Parser::parse_compound_stmt()
{
  const size_t start = idx_;
  expect(TokenKind::LBrace, "'{'");

  std::vector<VarDecl *> decls;
  std::vector<Stmt *> stmts;

  while (at_decl_start()) {
    if (auto * d = parse_var_decl()) {
      decls.push_back(d);
    }
  }

  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (at_function_start()) {
      diags_.report_error(cur(1).range, "nested function definitions are not supported");
      advance();
      synchronize_to_stmt();
      continue;
    }
    if (at_type_keyword()) {
      const Token & t = cur();
      diags_.report_error(t.range, "declaration after a statement")
        .with_help("declarations must come before the first statement of a block");
      if (at_decl_start()) {
        (void)parse_var_decl();
      } else {
        advance();
        synchronize_to_stmt();
      }
      continue;
    }

    const size_t before = idx_;
    if (auto * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      // parse_stmt reported an error without consuming; make progress.
      advance();
    }
  }

  expect(TokenKind::RBrace, "'}' to close the block", RecoverySet::Block);

  auto * block = ast_.create<CompoundStmt>(range_since(start), tokens_since(start));
  block->decls = ast_.copy_to_arena(decls);
  block->stmts = ast_.copy_to_arena(stmts);
  return block;
}

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();

  if (at(TokenKind::LBrace)) {
    return parse_compound_stmt();
  }
  if (at(TokenKind::Semicolon)) {
    const size_t start = idx_;
    advance();
    return ast_.create<EmptyStmt>(range_since(start), tokens_since(start));
  }
  if (is_kw("if", t)) {
    return parse_if_stmt();
  }
  if (is_kw("while", t)) {
    return parse_while_stmt();
  }
  if (is_kw("for", t)) {
    return parse_for_stmt();
  }
  if (is_kw("return", t)) {
    return parse_return_stmt();
  }
  if (is_kw("else", t)) {
    diags_.report_error(t.range, "'else' without a matching 'if'")
      .with_help("check the braces of the preceding 'if' statement");
    advance();
    return nullptr;
  }
  if (t.kind == TokenKind::Identifier && !is_reserved_word(t.text)) {
    if (cur(1).kind == TokenKind::LParen) {
      return parse_call_stmt();
    }
    return parse_assign(/*with_semicolon=*/true);
  }

  error_at(t, "expected statement");
  if (!at(TokenKind::RBrace)) {
    advance();
    synchronize_to_stmt();
  }
  return nullptr;
}

AssignStmt * Parser::parse_assign(bool with_semicolon)
{
  const size_t start = idx_;
  if (!at(TokenKind::Identifier) || is_reserved_word(cur().text)) {
    error_at(cur(), "expected assignment target");
    return nullptr;
  }
  const Token & target = advance();

  Expr * index = nullptr;
  if (match(TokenKind::LBracket)) {
    index = parse_expr();
    expect(TokenKind::RBracket, "']' after index expression");
  }

  if (!expect(TokenKind::Assign, "'=' in assignment")) {
    if (with_semicolon) {
      synchronize_to_stmt();
    }
    return nullptr;
  }

  Expr * value = parse_expr();

  // The span of a `for` clause stops here; a statement also owns its ';'.
  if (with_semicolon) {
    expect(TokenKind::Semicolon, "';' after assignment", RecoverySet::Statement);
  }

  return ast_.create<AssignStmt>(
    ast_.intern(target.text), index, value, range_since(start), tokens_since(start));
}

Stmt * Parser::parse_call_stmt()
{
  const size_t start = idx_;
  CallExpr * call = parse_call_expr();
  expect(TokenKind::Semicolon, "';' after function call", RecoverySet::Statement);
  return ast_.create<CallStmt>(call, range_since(start), tokens_since(start));
}

Stmt * Parser::parse_return_stmt()
{
  const size_t start = idx_;
  advance();  // 'return'

  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon)) {
    value = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after return statement", RecoverySet::Statement);
  return ast_.create<ReturnStmt>(value, range_since(start), tokens_since(start));
}

Stmt * Parser::parse_if_stmt()
{
  const size_t start = idx_;
  advance();  // 'if'

  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after condition", RecoverySet::Argument);

  Stmt * then_stmt = parse_stmt();
  Stmt * else_stmt = nullptr;
  if (is_kw("else", cur())) {
    advance();
    else_stmt = parse_stmt();
  }

  return ast_.create<IfStmt>(cond, then_stmt, else_stmt, range_since(start), tokens_since(start));
}

Stmt * Parser::parse_while_stmt()
{
  const size_t start = idx_;
  advance();  // 'while'

  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after condition", RecoverySet::Argument);

  Stmt * body = parse_stmt();
  return ast_.create<WhileStmt>(cond, body, range_since(start), tokens_since(start));
}

Stmt * Parser::parse_for_stmt()
{
  const size_t start = idx_;
  advance();  // 'for'

  expect(TokenKind::LParen, "'(' after 'for'");
  AssignStmt * init = parse_assign(/*with_semicolon=*/false);
  expect(TokenKind::Semicolon, "';' after the loop initializer");
  Expr * cond = parse_expr();
  expect(TokenKind::Semicolon, "';' after the loop condition");
  AssignStmt * update = parse_assign(/*with_semicolon=*/false);
  expect(TokenKind::RParen, "')' after the loop clauses", RecoverySet::Argument);

  Stmt * body = parse_stmt();
  return ast_.create<ForStmt>(init, cond, update, body, range_since(start), tokens_since(start));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::make_binary(Expr * lhs, BinaryOp op, Expr * rhs, size_t start)
{
  return ast_.create<BinaryExpr>(lhs, op, rhs, range_since(start), tokens_since(start));
}

Expr * Parser::make_missing_expr_at(const Token & t)
{
  const auto loc = t.range.get_begin();
  return ast_.create<MissingExpr>(SourceRange(loc, loc));
}

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  const size_t start = idx_;
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    lhs = make_binary(lhs, BinaryOp::Or, parse_and(), start);
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  const size_t start = idx_;
  Expr * lhs = parse_equality();
  while (match(TokenKind::AndAnd)) {
    lhs = make_binary(lhs, BinaryOp::And, parse_equality(), start);
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  const size_t start = idx_;
  Expr * lhs = parse_comparison();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = advance().kind == TokenKind::EqEq ? BinaryOp::Eq : BinaryOp::Ne;
    lhs = make_binary(lhs, op, parse_comparison(), start);
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  const size_t start = idx_;
  Expr * lhs = parse_add();
  while (true) {
    BinaryOp op = BinaryOp::Lt;
    switch (cur().kind) {
      case TokenKind::Lt:
        op = BinaryOp::Lt;
        break;
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        return lhs;
    }
    advance();
    lhs = make_binary(lhs, op, parse_add(), start);
  }
}

Expr * Parser::parse_add()
{
  const size_t start = idx_;
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    lhs = make_binary(lhs, op, parse_mul(), start);
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  const size_t start = idx_;
  Expr * lhs = parse_unary();
  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    const TokenKind k = advance().kind;
    BinaryOp op = BinaryOp::Mul;
    if (k == TokenKind::Slash) {
      op = BinaryOp::Div;
    } else if (k == TokenKind::Percent) {
      op = BinaryOp::Mod;
    }
    lhs = make_binary(lhs, op, parse_unary(), start);
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const size_t start = idx_;
  if (match(TokenKind::Bang)) {
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Not, e, range_since(start), tokens_since(start));
  }
  if (match(TokenKind::Minus)) {
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Neg, e, range_since(start), tokens_since(start));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  const size_t start = idx_;
  Expr * e = parse_primary();

  while (match(TokenKind::LBracket)) {
    Expr * index = parse_expr();
    expect(TokenKind::RBracket, "']' after index expression");
    e = ast_.create<IndexExpr>(e, index, range_since(start), tokens_since(start));
  }
  return e;
}

CallExpr * Parser::parse_call_expr()
{
  const size_t start = idx_;
  const Token & callee = advance();
  advance();  // '('

  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    do {
      args.push_back(parse_expr());
    } while (match(TokenKind::Comma));
  }
  expect(TokenKind::RParen, "')' after call arguments", RecoverySet::Argument);

  return ast_.create<CallExpr>(
    ast_.intern(callee.text), ast_.copy_to_arena(args), range_since(start), tokens_since(start));
}

Expr * Parser::parse_primary()
{
  const size_t start = idx_;
  const Token & t = cur();

  if (match(TokenKind::IntLiteral)) {
    const auto v = parse_int(t.text);
    if (!v) {
      diags_.report_error(t.range, "integer literal is too large", "does not fit in 64 bits");
    }
    return ast_.create<IntLiteral>(v.value_or(0), t.range, tokens_since(start));
  }

  if (match(TokenKind::FloatLiteral)) {
    const std::string tmp(t.text);
    const double v = std::strtod(tmp.c_str(), nullptr);
    return ast_.create<FloatLiteral>(v, t.range, tokens_since(start));
  }

  if (t.kind == TokenKind::Identifier && !is_reserved_word(t.text)) {
    if (cur(1).kind == TokenKind::LParen) {
      return parse_call_expr();
    }
    advance();
    return ast_.create<NameExpr>(ast_.intern(t.text), t.range, tokens_since(start));
  }

  if (match(TokenKind::LParen)) {
    Expr * inner = parse_expr();
    expect(TokenKind::RParen, "')' after expression");
    return ast_.create<ParenExpr>(inner, range_since(start), tokens_since(start));
  }

  error_at(t, "expected expression");
  return make_missing_expr_at(t);
}

}  // namespace cfgc::syntax
