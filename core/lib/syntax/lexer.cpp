#include "sql_assist/syntax/lexer.hpp"

#include "sql_assist/basic/ascii.hpp"
#include "sql_assist/syntax/keywords.hpp"

namespace sql_assist::syntax
{
namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool is_ident_start(const utf8::DecodedChar & c)
{
  return c.valid && (c.code_point == '_' || utf8::is_letter(c.code_point));
}

bool is_ident_continue(const utf8::DecodedChar & c)
{
  return c.valid &&
         (c.code_point == '_' || utf8::is_letter(c.code_point) || utf8::is_digit(c.code_point));
}

bool is_number_char(const utf8::DecodedChar & c) { return c.valid && utf8::is_digit(c.code_point); }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, size_t start) const
{
  return make_token(kind, start, std::string(src_.substr(start, pos_ - start)));
}

Token Lexer::make_token(TokenKind kind, size_t start, std::string value) const
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  t.value = std::move(value);
  return t;
}

Token Lexer::lex_whitespace()
{
  const size_t start = pos_;
  while (!eof() && is_space(peek())) {
    advance(1);
  }
  return make_token(TokenKind::Whitespace, start);
}

Token Lexer::lex_line_comment()
{
  const size_t start = pos_;
  advance(2);
  // The newline belongs to the following whitespace token.
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  return make_token(TokenKind::LineComment, start);
}

Token Lexer::lex_block_comment()
{
  const size_t start = pos_;
  advance(2);
  while (!eof()) {
    if (starts_with("*/")) {
      advance(2);
      break;
    }
    advance(1);
  }
  return make_token(TokenKind::BlockComment, start);
}

Token Lexer::lex_quoted(char quote, TokenKind kind)
{
  const size_t start = pos_;
  advance(1);  // opening quote

  std::string value;
  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      if (peek(1) == quote) {
        value.push_back(quote);
        advance(2);
        continue;
      }
      advance(1);  // closing quote
      return make_token(kind, start, std::move(value));
    }
    value.push_back(c);
    advance(1);
  }

  // Unterminated: the token runs to the end of input.
  return make_token(kind, start, std::move(value));
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  // Digits and dots (a leading '.' is allowed when followed by a digit).
  while (!eof()) {
    if (peek() == '.') {
      advance(1);
      continue;
    }
    const auto c = peek_char();
    if (!is_number_char(c)) {
      break;
    }
    advance(c.length);
  }

  // Exponent
  if (!eof() && (peek() == 'e' || peek() == 'E')) {
    advance(1);
    if (peek() == '+' || peek() == '-') {
      advance(1);
    }
    while (!eof()) {
      const auto c = peek_char();
      if (!is_number_char(c)) {
        break;
      }
      advance(c.length);
    }
  }

  return make_token(TokenKind::Number, start);
}

Token Lexer::lex_identifier_or_keyword()
{
  const size_t start = pos_;
  while (!eof()) {
    const auto c = peek_char();
    if (!is_ident_continue(c)) {
      break;
    }
    advance(c.length);
  }

  const auto word = src_.substr(start, pos_ - start);
  auto upper = ascii::to_upper(word);
  if (is_keyword(upper)) {
    return make_token(TokenKind::Keyword, start, std::move(upper));
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::next_token()
{
  const char c = peek();

  if (is_space(c)) {
    return lex_whitespace();
  }
  if (starts_with("--")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }
  if (c == '\'') {
    return lex_quoted('\'', TokenKind::StringLiteral);
  }
  if (c == '"') {
    return lex_quoted('"', TokenKind::QuotedIdentifier);
  }

  const size_t start = pos_;
  switch (c) {
    case '(':
      advance(1);
      return make_token(TokenKind::LeftParen, start);
    case ')':
      advance(1);
      return make_token(TokenKind::RightParen, start);
    case ',':
      advance(1);
      return make_token(TokenKind::Comma, start);
    case '*':
      advance(1);
      return make_token(TokenKind::Star, start);
    default:
      break;
  }

  const auto ch = peek_char();
  if (is_number_char(ch) || (c == '.' && is_number_char(peek_char(1)))) {
    return lex_number();
  }
  if (is_ident_start(ch)) {
    return lex_identifier_or_keyword();
  }

  // One code point, or one byte when the input is not valid UTF-8.
  advance(ch.length);
  return make_token(TokenKind::Other, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 3 + 1);

  while (!eof()) {
    out.push_back(next_token());
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src)
{
  Lexer lex(src);
  return lex.lex_all();
}

}  // namespace sql_assist::syntax
