// sql_assist/analysis/error_position.cpp - Remote error position mapping
#include "sql_assist/analysis/error_position.hpp"

#include <charconv>
#include <re2/re2.h>
#include <string>

#include "sql_assist/basic/utf8.hpp"
#include "sql_assist/syntax/lexer.hpp"
#include "sql_assist/syntax/token_span.hpp"

namespace sql_assist::analysis
{

namespace
{

const re2::RE2 & position_regex()
{
  // The engine sometimes writes "Column:" and sometimes "Column".
  static const re2::RE2 re(R"(Line:\s*(\d+),\s*Column:?\s*(\d+))");
  return re;
}

std::optional<int64_t> parse_int(re2::StringPiece digits)
{
  int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<ErrorPosition> parse_error_position(std::string_view message)
{
  re2::StringPiece line_digits;
  re2::StringPiece column_digits;
  if (!re2::RE2::PartialMatch(
        re2::StringPiece(message.data(), message.size()), position_regex(), &line_digits,
        &column_digits)) {
    return std::nullopt;
  }

  const auto line = parse_int(line_digits);
  const auto column = parse_int(column_digits);
  if (!line || !column) {
    return std::nullopt;
  }
  return ErrorPosition{*line, *column};
}

std::optional<uint32_t> character_offset(int64_t line, int64_t column, std::string_view text)
{
  if (line < 1 || column < 1) {
    return std::nullopt;
  }

  size_t pos = 0;
  for (int64_t current = 1; current < line; ++current) {
    const auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      return std::nullopt;
    }
    pos = nl + 1;
  }

  const auto offset = utf8::advance(text, pos, static_cast<size_t>(column - 1));
  if (!offset) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(*offset);
}

std::optional<SourceRange> token_range_at_offset(uint32_t offset, std::string_view text)
{
  const auto tokens = syntax::tokenize(text);
  const syntax::TokenSpan toks(tokens);

  for (size_t i = 0; i < toks.size(); ++i) {
    if (!toks[i].range.contains(SourceLocation(offset))) {
      continue;
    }
    if (!syntax::is_trivia(toks[i].kind)) {
      return toks[i].range;
    }
    const size_t next = syntax::skip_trivia(toks, i + 1);
    if (next < toks.size()) {
      return toks[next].range;
    }
    return std::nullopt;
  }

  if (offset >= text.size()) {
    if (const auto last = syntax::last_non_trivia(toks)) {
      return toks[*last].range;
    }
  }
  return std::nullopt;
}

std::optional<SourceRange> error_highlight_range(
  int64_t line, int64_t column, std::string_view text)
{
  const auto offset = character_offset(line, column, text);
  if (!offset) {
    return std::nullopt;
  }
  return token_range_at_offset(*offset, text);
}

std::optional<ErrorPosition> relay_remote_error(
  std::string_view message, std::string_view text, DiagnosticBag & diags)
{
  const auto pos = parse_error_position(message);

  std::optional<SourceRange> range;
  if (pos) {
    range = error_highlight_range(pos->line, pos->column, text);
  }

  auto builder = diags.report_error(
    range.value_or(SourceRange{}), std::string(message), range ? "reported here" : "");
  builder.with_code(std::string(k_remote_error_code));
  if (pos && !range) {
    builder.with_help("the reported position lies outside the query text");
  }
  return pos;
}

}  // namespace sql_assist::analysis
