// sql_assist/lsp/highlighter.cpp - RE2-based SQL syntax highlighting
#include "sql_assist/lsp/highlighter.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "sql_assist/syntax/keywords.hpp"

namespace sql_assist::lsp
{

namespace
{

template <size_t N>
std::string word_alternation(const std::array<std::string_view, N> & words)
{
  std::string pattern = "\\b(?:";
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      pattern += '|';
    }
    pattern += words[i];
  }
  pattern += ")\\b";
  return pattern;
}

re2::RE2::Options pattern_options(bool case_sensitive)
{
  re2::RE2::Options opts;
  opts.set_encoding(re2::RE2::Options::EncodingLatin1);
  opts.set_case_sensitive(case_sensitive);
  opts.set_log_errors(false);
  return opts;
}

/// Ranges painted by the comment and quote passes.
class ProtectedRanges
{
public:
  void add(SourceRange r) { ranges_.push_back(r); }

  /// Sort by start and record the furthest end reached so far.
  void seal()
  {
    std::sort(ranges_.begin(), ranges_.end(), [](SourceRange a, SourceRange b) {
      return a.begin_offset() < b.begin_offset();
    });
    reach_.clear();
    reach_.reserve(ranges_.size());
    uint32_t furthest = 0;
    for (const auto r : ranges_) {
      furthest = std::max(furthest, r.end_offset());
      reach_.push_back(furthest);
    }
  }

  /// True when `r` lies inside a single protected range. Requires seal().
  [[nodiscard]] bool covers(SourceRange r) const
  {
    auto it = std::upper_bound(
      ranges_.begin(), ranges_.end(), r.begin_offset(),
      [](uint32_t offset, SourceRange p) { return offset < p.begin_offset(); });
    if (it == ranges_.begin()) {
      return false;
    }
    return reach_[static_cast<size_t>(it - ranges_.begin()) - 1] >= r.end_offset();
  }

private:
  std::vector<SourceRange> ranges_;
  std::vector<uint32_t> reach_;
};

/// Run one pass. When `guard` is non-null, matches fully inside a guarded
/// range are skipped; otherwise each match is recorded in `protect`.
void run_pass(
  const re2::RE2 & re, std::string_view text, HighlightStyle style,
  std::vector<HighlightSpan> & out, ProtectedRanges * protect, const ProtectedRanges * guard)
{
  if (!re.ok()) {
    return;
  }

  const re2::StringPiece input(text.data(), text.size());
  re2::StringPiece m;
  size_t pos = 0;
  while (pos < text.size() &&
         re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, &m, 1)) {
    const auto start = static_cast<size_t>(m.data() - text.data());
    if (m.empty()) {
      pos = start + 1;
      continue;
    }
    pos = start + m.size();

    const SourceRange range(static_cast<uint32_t>(start), static_cast<uint32_t>(pos));
    if (guard != nullptr && guard->covers(range)) {
      continue;
    }
    out.push_back(HighlightSpan{range, style});
    if (protect != nullptr) {
      protect->add(range);
    }
  }
}

}  // namespace

SyntaxHighlighter::SyntaxHighlighter()
: comment_re_(R"(--[^\n]*|/\*[\s\S]*?(?:\*/|$))", pattern_options(true)),
  single_quote_re_(R"('[^']*(?:''[^']*)*')", pattern_options(true)),
  double_quote_re_(R"("[^"]*(?:""[^"]*)*")", pattern_options(true)),
  number_re_(R"(\b\d+(?:\.\d+)?\b)", pattern_options(true)),
  keyword_re_(word_alternation(syntax::k_editor_keywords), pattern_options(false)),
  function_re_(word_alternation(syntax::k_functions), pattern_options(false))
{
}

std::vector<HighlightSpan> SyntaxHighlighter::classify(std::string_view text) const
{
  std::vector<HighlightSpan> spans;
  if (text.empty()) {
    return spans;
  }

  ProtectedRanges protected_ranges;
  run_pass(comment_re_, text, HighlightStyle::Comment, spans, &protected_ranges, nullptr);
  run_pass(single_quote_re_, text, HighlightStyle::String, spans, &protected_ranges, nullptr);
  run_pass(
    double_quote_re_, text, HighlightStyle::QuotedIdentifier, spans, &protected_ranges, nullptr);

  protected_ranges.seal();

  run_pass(number_re_, text, HighlightStyle::Number, spans, nullptr, &protected_ranges);
  run_pass(keyword_re_, text, HighlightStyle::Keyword, spans, nullptr, &protected_ranges);
  run_pass(function_re_, text, HighlightStyle::Function, spans, nullptr, &protected_ranges);

  std::stable_sort(spans.begin(), spans.end(), [](const HighlightSpan & a, const HighlightSpan & b) {
    return a.range.begin_offset() < b.range.begin_offset();
  });
  return spans;
}

const SyntaxHighlighter & SyntaxHighlighter::shared()
{
  static const SyntaxHighlighter instance;
  return instance;
}

std::vector<HighlightSpan> classify(std::string_view text)
{
  return SyntaxHighlighter::shared().classify(text);
}

}  // namespace sql_assist::lsp
