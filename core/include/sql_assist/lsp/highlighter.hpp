// sql_assist/lsp/highlighter.hpp - Regex-based SQL syntax highlighting
#pragma once

#include <cstdint>
#include <re2/re2.h>
#include <string_view>
#include <vector>

#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist::lsp
{

/// Styles in the order their passes run.
enum class HighlightStyle : uint8_t {
  Comment,
  String,
  QuotedIdentifier,
  Number,
  Keyword,
  Function,
};

[[nodiscard]] constexpr std::string_view to_string(HighlightStyle s) noexcept
{
  switch (s) {
    case HighlightStyle::Comment:
      return "comment";
    case HighlightStyle::String:
      return "string";
    case HighlightStyle::QuotedIdentifier:
      return "quoted_identifier";
    case HighlightStyle::Number:
      return "number";
    case HighlightStyle::Keyword:
      return "keyword";
    case HighlightStyle::Function:
      return "function";
  }
  return "comment";
}

struct HighlightSpan
{
  SourceRange range;
  HighlightStyle style = HighlightStyle::Comment;

  [[nodiscard]] bool operator==(const HighlightSpan & other) const = default;
};

/**
 * Classifies SQL text with a fixed sequence of regex passes.
 *
 * Comments, strings and quoted identifiers are painted first and protect
 * the text they cover; numbers, keywords and function names are only
 * painted outside protected text. The highlighter does not use the lexer,
 * so it keeps working on text the lexer would split differently.
 *
 * Patterns run on RE2 in Latin-1 mode, so matching is linear in the text
 * and offsets are byte offsets. The compiled patterns are immutable after
 * construction, so one instance may be shared between threads.
 */
class SyntaxHighlighter
{
public:
  SyntaxHighlighter();

  /// Spans sorted by start offset; spans starting together keep pass order.
  [[nodiscard]] std::vector<HighlightSpan> classify(std::string_view text) const;

  /// Process-wide instance.
  static const SyntaxHighlighter & shared();

private:
  re2::RE2 comment_re_;
  re2::RE2 single_quote_re_;
  re2::RE2 double_quote_re_;
  re2::RE2 number_re_;
  re2::RE2 keyword_re_;
  re2::RE2 function_re_;
};

/// SyntaxHighlighter::shared().classify(text)
[[nodiscard]] std::vector<HighlightSpan> classify(std::string_view text);

}  // namespace sql_assist::lsp
