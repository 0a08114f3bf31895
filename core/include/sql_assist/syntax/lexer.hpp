// sql_assist/syntax/lexer.hpp - Lossless SQL lexer
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sql_assist/basic/utf8.hpp"
#include "sql_assist/syntax/token.hpp"

namespace sql_assist::syntax
{

/**
 * Hand-written SQL lexer.
 *
 * Every byte of the input is covered by exactly one token, trivia
 * included, so concatenating the token slices reproduces the input.
 * Unterminated strings and comments run to the end of the input.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] utf8::DecodedChar peek_char(size_t lookahead = 0) const noexcept
  {
    return utf8::decode(src_, pos_ + lookahead);
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  [[nodiscard]] Token lex_whitespace();
  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_quoted(char quote, TokenKind kind);
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_identifier_or_keyword();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const;
  [[nodiscard]] Token make_token(TokenKind kind, size_t start, std::string value) const;

  std::string_view src_;
  size_t pos_ = 0;
};

/// Tokenize `src` in one call. Never fails.
[[nodiscard]] std::vector<Token> tokenize(std::string_view src);

}  // namespace sql_assist::syntax
