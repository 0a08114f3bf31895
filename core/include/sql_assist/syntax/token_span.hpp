// sql_assist/syntax/token_span.hpp - Helpers for walking token sequences
#pragma once

#include <cstddef>
#include <gsl/span>
#include <optional>

#include "sql_assist/syntax/token.hpp"

namespace sql_assist::syntax
{

using TokenSpan = gsl::span<const Token>;

/// Index of the first non-trivia token at or after `idx` (toks.size() if none).
[[nodiscard]] inline size_t skip_trivia(TokenSpan toks, size_t idx) noexcept
{
  while (idx < toks.size() && is_trivia(toks[idx].kind)) {
    ++idx;
  }
  return idx;
}

/// Index of the last non-trivia token, if any.
[[nodiscard]] inline std::optional<size_t> last_non_trivia(TokenSpan toks) noexcept
{
  for (size_t i = toks.size(); i > 0; --i) {
    if (!is_trivia(toks[i - 1].kind)) {
      return i - 1;
    }
  }
  return std::nullopt;
}

}  // namespace sql_assist::syntax
