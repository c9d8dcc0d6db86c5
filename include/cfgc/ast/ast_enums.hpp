// cfgc/ast/ast_enums.hpp - Node kinds and operators of the simpleC AST
#pragma once

#include <cstdint>
#include <string_view>

namespace cfgc
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Closed set of AST node kinds.
 *
 * Kinds are grouped by category so the category classof() checks are range
 * comparisons. Keep each group contiguous.
 */
enum class NodeKind : uint8_t {
  // === Expressions ===
  NameExpr,
  IntLiteral,
  FloatLiteral,
  IndexExpr,
  CallExpr,
  ParenExpr,
  UnaryExpr,
  BinaryExpr,
  MissingExpr,

  // === Statements ===
  CompoundStmt,
  AssignStmt,
  CallStmt,
  ReturnStmt,
  IfStmt,
  WhileStmt,
  ForStmt,
  EmptyStmt,

  // === Declarations ===
  VarDecl,
  ParamDecl,
  FunctionDecl,

  // === Supporting / top-level ===
  Declarator,
  TranslationUnit,
};

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::NameExpr && k <= NodeKind::MissingExpr;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind k) noexcept
{
  return k >= NodeKind::CompoundStmt && k <= NodeKind::EmptyStmt;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind k) noexcept
{
  return k >= NodeKind::VarDecl && k <= NodeKind::FunctionDecl;
}

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Eq,   ///< ==
  Ne,   ///< !=
  Lt,   ///< <
  Le,   ///< <=
  Gt,   ///< >
  Ge,   ///< >=
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
    case NodeKind::NameExpr:
      return "name_expr";
    case NodeKind::IntLiteral:
      return "int_literal";
    case NodeKind::FloatLiteral:
      return "float_literal";
    case NodeKind::IndexExpr:
      return "index_expr";
    case NodeKind::CallExpr:
      return "call_expr";
    case NodeKind::ParenExpr:
      return "paren_expr";
    case NodeKind::UnaryExpr:
      return "unary_expr";
    case NodeKind::BinaryExpr:
      return "binary_expr";
    case NodeKind::MissingExpr:
      return "missing_expr";
    case NodeKind::CompoundStmt:
      return "compound_stmt";
    case NodeKind::AssignStmt:
      return "assign_stmt";
    case NodeKind::CallStmt:
      return "call_stmt";
    case NodeKind::ReturnStmt:
      return "return_stmt";
    case NodeKind::IfStmt:
      return "if_stmt";
    case NodeKind::WhileStmt:
      return "while_stmt";
    case NodeKind::ForStmt:
      return "for_stmt";
    case NodeKind::EmptyStmt:
      return "empty_stmt";
    case NodeKind::VarDecl:
      return "var_decl";
    case NodeKind::ParamDecl:
      return "param_decl";
    case NodeKind::FunctionDecl:
      return "function_decl";
    case NodeKind::Declarator:
      return "declarator";
    case NodeKind::TranslationUnit:
      return "translation_unit";
  }
  return "";
}

}  // namespace cfgc
