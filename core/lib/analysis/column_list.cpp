// sql_assist/analysis/column_list.cpp - SELECT column list location
#include "sql_assist/analysis/column_list.hpp"

#include <algorithm>

#include "sql_assist/syntax/lexer.hpp"
#include "sql_assist/syntax/token_span.hpp"

namespace sql_assist::analysis
{

using syntax::TokenKind;

std::optional<SourceRange> select_column_list_range(std::string_view text)
{
  const auto tokens = syntax::tokenize(text);
  const syntax::TokenSpan toks(tokens);

  size_t idx = syntax::skip_trivia(toks, 0);
  if (idx >= toks.size() || !toks[idx].is_keyword("SELECT")) {
    return std::nullopt;
  }

  idx = syntax::skip_trivia(toks, idx + 1);
  if (idx < toks.size() && toks[idx].is_keyword("DISTINCT")) {
    idx = syntax::skip_trivia(toks, idx + 1);
  }
  if (idx >= toks.size()) {
    return std::nullopt;
  }
  const size_t list_start = idx;

  int depth = 0;
  std::optional<size_t> from_idx;
  for (size_t j = list_start; j < toks.size(); ++j) {
    const auto & t = toks[j];
    if (t.kind == TokenKind::LeftParen) {
      ++depth;
    } else if (t.kind == TokenKind::RightParen) {
      depth = std::max(0, depth - 1);
    } else if (depth == 0 && t.is_keyword("FROM")) {
      from_idx = j;
      break;
    }
  }

  if (!from_idx || *from_idx <= list_start) {
    return std::nullopt;
  }

  // Drop trivia between the last column token and FROM.
  size_t last = *from_idx - 1;
  while (last > list_start && syntax::is_trivia(toks[last].kind)) {
    --last;
  }

  return SourceRange(toks[list_start].begin(), toks[last].end());
}

std::optional<std::string> replace_select_column_list(
  std::string_view text, std::string_view replacement)
{
  const auto range = select_column_list_range(text);
  if (!range) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(text.size() - range->size() + replacement.size());
  out.append(text.substr(0, range->begin_offset()));
  out.append(replacement);
  out.append(text.substr(range->end_offset()));
  return out;
}

}  // namespace sql_assist::analysis
