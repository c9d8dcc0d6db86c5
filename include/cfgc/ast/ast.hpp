// cfgc/ast/ast.hpp - AST node classes for simpleC
//
// LLVM/Clang style hierarchy: every node carries a NodeKind used by classof()
// so cfgc::isa / cast / dyn_cast work without C++ RTTI.
//
// Besides its SourceRange each node keeps the span of source tokens it covers.
// The CFG lowering prints statements from those spans, so they must stay
// exactly the tokens the parser consumed for the node.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "cfgc/ast/ast_enums.hpp"
#include "cfgc/basic/casting.hpp"
#include "cfgc/basic/source_manager.hpp"
#include "cfgc/syntax/token.hpp"

namespace cfgc
{

using TokenSpan = gsl::span<const syntax::Token>;

// ============================================================================
// Base Classes
// ============================================================================

class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;
  TokenSpan tokens_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }
  [[nodiscard]] TokenSpan get_tokens() const noexcept { return tokens_; }

protected:
  AstNode(NodeKind k, SourceRange r, TokenSpan toks) : kind(k), range_(r), tokens_(toks) {}
  ~AstNode() = default;
};

/**
 * CRTP base providing classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  NodeBase(SourceRange r, TokenSpan toks) : Base(K, r, toks) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->get_kind()); }

protected:
  Expr(NodeKind k, SourceRange r, TokenSpan toks) : AstNode(k, r, toks) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->get_kind()); }

protected:
  Stmt(NodeKind k, SourceRange r, TokenSpan toks) : AstNode(k, r, toks) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->get_kind()); }

protected:
  Decl(NodeKind k, SourceRange r, TokenSpan toks) : AstNode(k, r, toks) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::NameExpr>
{
public:
  std::string_view name;

  NameExpr(std::string_view n, SourceRange r, TokenSpan toks) : NodeBase(r, toks), name(n) {}
};

class IntLiteral : public NodeBase<IntLiteral, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  IntLiteral(int64_t v, SourceRange r, TokenSpan toks) : NodeBase(r, toks), value(v) {}
};

class FloatLiteral : public NodeBase<FloatLiteral, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  FloatLiteral(double v, SourceRange r, TokenSpan toks) : NodeBase(r, toks), value(v) {}
};

/// base[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), base(b), index(i)
  {
  }
};

/// callee(args...). simpleC only calls functions by name.
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), callee(c), args(a)
  {
  }
};

/// `( inner )`. Kept as a node so the token span still covers the parentheses.
class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::ParenExpr>
{
public:
  Expr * inner;

  ParenExpr(Expr * e, SourceRange r, TokenSpan toks) : NodeBase(r, toks), inner(e) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), op(o), operand(e)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range, TokenSpan toks)
  : NodeBase(range, toks), lhs(l), op(o), rhs(r)
  {
  }
};

/// Parser recovery placeholder; never reaches lowering.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r) : NodeBase(r, {}) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// One name in a declaration list, optionally an array: `x` or `buf[16]`.
class Declarator : public NodeBase<Declarator, AstNode, NodeKind::Declarator>
{
public:
  std::string_view name;
  std::optional<int64_t> array_size;

  Declarator(std::string_view n, std::optional<int64_t> size, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), name(n), array_size(size)
  {
  }
};

/// `int a, b[4];` at file scope or at the start of a block.
class VarDecl : public NodeBase<VarDecl, Decl, NodeKind::VarDecl>
{
public:
  std::string_view type_name;
  gsl::span<Declarator *> declarators;

  VarDecl(std::string_view t, gsl::span<Declarator *> d, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), type_name(t), declarators(d)
  {
  }
};

class ParamDecl : public NodeBase<ParamDecl, Decl, NodeKind::ParamDecl>
{
public:
  std::string_view type_name;
  std::string_view name;
  bool is_array = false;  ///< declared as `int a[]`

  ParamDecl(std::string_view t, std::string_view n, bool arr, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), type_name(t), name(n), is_array(arr)
  {
  }
};

class CompoundStmt;

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view return_type;
  std::string_view name;
  gsl::span<ParamDecl *> params;
  TokenSpan param_tokens;  ///< everything between the parentheses, commas included
  CompoundStmt * body = nullptr;

  FunctionDecl(std::string_view ret, std::string_view n, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), return_type(ret), name(n)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

class CompoundStmt : public NodeBase<CompoundStmt, Stmt, NodeKind::CompoundStmt>
{
public:
  gsl::span<VarDecl *> decls;
  gsl::span<Stmt *> stmts;

  CompoundStmt(SourceRange r, TokenSpan toks) : NodeBase(r, toks) {}
};

/**
 * `target = value;` or `target[index] = value;`.
 *
 * As the init or update clause of a `for` the token span stops before the
 * `;`. As a statement it includes it.
 */
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  std::string_view target;
  Expr * index = nullptr;
  Expr * value;

  AssignStmt(std::string_view t, Expr * i, Expr * v, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), target(t), index(i), value(v)
  {
  }
};

class CallStmt : public NodeBase<CallStmt, Stmt, NodeKind::CallStmt>
{
public:
  CallExpr * call;

  CallStmt(CallExpr * c, SourceRange r, TokenSpan toks) : NodeBase(r, toks), call(c) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;  ///< nullptr for a bare `return;`

  ReturnStmt(Expr * v, SourceRange r, TokenSpan toks) : NodeBase(r, toks), value(v) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  Stmt * then_stmt;
  Stmt * else_stmt = nullptr;

  IfStmt(Expr * c, Stmt * t, Stmt * e, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), condition(c), then_stmt(t), else_stmt(e)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  Stmt * body;

  WhileStmt(Expr * c, Stmt * b, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), condition(c), body(b)
  {
  }
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  AssignStmt * init;
  Expr * condition;
  AssignStmt * update;
  Stmt * body;

  ForStmt(
    AssignStmt * i, Expr * c, AssignStmt * u, Stmt * b, SourceRange r, TokenSpan toks)
  : NodeBase(r, toks), init(i), condition(c), update(u), body(b)
  {
  }
};

/// A lone `;`.
class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::EmptyStmt>
{
public:
  EmptyStmt(SourceRange r, TokenSpan toks) : NodeBase(r, toks) {}
};

// ============================================================================
// Top-level
// ============================================================================

class TranslationUnit : public NodeBase<TranslationUnit, AstNode, NodeKind::TranslationUnit>
{
public:
  gsl::span<VarDecl *> globals;
  gsl::span<FunctionDecl *> functions;

  TranslationUnit(SourceRange r, TokenSpan toks) : NodeBase(r, toks) {}
};

}  // namespace cfgc
