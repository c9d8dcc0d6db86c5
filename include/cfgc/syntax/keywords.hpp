#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace cfgc::syntax
{

// Keywords are lexed as identifiers and recognized by the parser.

inline constexpr std::array<std::string_view, 4> k_type_keywords = {
  "int",
  "float",
  "char",
  "void",
};

inline constexpr std::array<std::string_view, 5> k_statement_keywords = {
  "if", "else", "while", "for", "return",
};

[[nodiscard]] inline bool is_type_keyword(std::string_view ident) noexcept
{
  return std::find(k_type_keywords.begin(), k_type_keywords.end(), ident) !=
         k_type_keywords.end();
}

[[nodiscard]] inline bool is_reserved_word(std::string_view ident) noexcept
{
  return is_type_keyword(ident) ||
         std::find(k_statement_keywords.begin(), k_statement_keywords.end(), ident) !=
           k_statement_keywords.end();
}

}  // namespace cfgc::syntax
