#include "cfgc/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace cfgc::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Two-character operators, checked before the single-character table.
constexpr std::array<std::pair<std::string_view, TokenKind>, 6> k_two_char_ops = {{
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
}};

TokenKind single_char_kind(char ch)
{
  switch (ch) {
    case '(':
      return TokenKind::LParen;
    case ')':
      return TokenKind::RParen;
    case '{':
      return TokenKind::LBrace;
    case '}':
      return TokenKind::RBrace;
    case '[':
      return TokenKind::LBracket;
    case ']':
      return TokenKind::RBracket;
    case ',':
      return TokenKind::Comma;
    case ';':
      return TokenKind::Semicolon;
    case '=':
      return TokenKind::Assign;
    case '+':
      return TokenKind::Plus;
    case '-':
      return TokenKind::Minus;
    case '*':
      return TokenKind::Star;
    case '/':
      return TokenKind::Slash;
    case '%':
      return TokenKind::Percent;
    case '!':
      return TokenKind::Bang;
    case '<':
      return TokenKind::Lt;
    case '>':
      return TokenKind::Gt;
    default:
      return TokenKind::Unknown;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = SourceRange(file_id_, start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance();
      continue;
    }
    break;
  }
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != '\n') {
    advance();
  }
  Token t = make_token(TokenKind::LineComment, start);
  if (!t.text.empty() && t.text.back() == '\r') {
    t.text.remove_suffix(1);
  }
  return t;
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance();
  }
  if (eof()) {
    // Unterminated: surface the opener so the frontend can point at it.
    Token t = make_token(TokenKind::Unknown, start);
    t.range = SourceRange(file_id_, start, start + 2);
    t.text = src_.substr(start, 2);
    return t;
  }
  advance(2);
  return make_token(TokenKind::BlockComment, start);
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && is_digit(peek())) {
    advance();
  }

  bool is_float = false;

  if (peek() == '.' && is_digit(peek(1))) {
    is_float = true;
    advance();
    while (!eof() && is_digit(peek())) {
      advance();
    }
  }

  // Exponent only when digits follow, so `1e` lexes as `1` then `e`.
  if ((peek() == 'e' || peek() == 'E') &&
      (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
    is_float = true;
    advance(2);
    while (!eof() && is_digit(peek())) {
      advance();
    }
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (starts_with("//")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }

  for (const auto & [spelling, kind] : k_two_char_ops) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make_token(kind, start);
    }
  }

  const TokenKind kind = single_char_kind(peek());
  advance();
  return make_token(kind, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace cfgc::syntax
