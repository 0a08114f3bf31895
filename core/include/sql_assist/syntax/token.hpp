// sql_assist/syntax/token.hpp - SQL token kinds and token record
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist::syntax
{

enum class TokenKind : uint8_t {
  Keyword,           // value: canonical uppercase keyword
  Identifier,        // value: original-case text
  QuotedIdentifier,  // value: contents without quotes, "" unescaped
  StringLiteral,     // value: contents without quotes, '' unescaped
  Number,            // value: raw text

  // Punctuation
  Comma,
  Star,
  LeftParen,
  RightParen,

  // Trivia
  Whitespace,
  LineComment,   // -- ...
  BlockComment,  // /* ... */

  Other,  // any other single character (operators, ';', '.', ...)
};

struct Token
{
  TokenKind kind = TokenKind::Other;
  SourceRange range;  // byte range in the source (including quotes)
  std::string value;  // payload, see TokenKind

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end_offset(); }

  [[nodiscard]] bool is_keyword(std::string_view upper) const noexcept
  {
    return kind == TokenKind::Keyword && value == upper;
  }

  [[nodiscard]] bool operator==(const Token & other) const = default;
};

/// Whitespace and comments.
[[nodiscard]] constexpr bool is_trivia(TokenKind k) noexcept
{
  return k == TokenKind::Whitespace || k == TokenKind::LineComment ||
         k == TokenKind::BlockComment;
}

/// Source slice covered by `token`, quotes and comment markers included.
[[nodiscard]] inline std::string_view token_text(std::string_view src, const Token & token) noexcept
{
  return slice(src, token.range);
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::QuotedIdentifier:
      return "quoted_identifier";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::Number:
      return "number";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Star:
      return "*";
    case TokenKind::LeftParen:
      return "(";
    case TokenKind::RightParen:
      return ")";
    case TokenKind::Whitespace:
      return "<whitespace>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Other:
      return "other";
  }
  return "";
}

}  // namespace sql_assist::syntax
