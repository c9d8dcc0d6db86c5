// cfgc/syntax/token.hpp - simpleC token kinds and the Token record
#pragma once

#include <cstdint>
#include <string_view>

#include "cfgc/basic/source_manager.hpp"

namespace cfgc::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Trivia. The lexer emits them so tools can see every byte; the frontend
  // drops them before parsing.
  LineComment,   // // ...
  BlockComment,  // /* ... */

  Identifier,  // keywords are identifiers checked by spelling
  IntLiteral,
  FloatLiteral,

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Semicolon,

  Assign,  // =
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Bang,

  AndAnd,
  OrOr,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;  ///< exact source spelling

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }

  [[nodiscard]] bool is_trivia() const noexcept
  {
    return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer literal";
    case TokenKind::FloatLiteral:
      return "float literal";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Assign:
      return "=";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Bang:
      return "!";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "";
}

}  // namespace cfgc::syntax
