#include "sql_assist/lsp/completion_context.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "sql_assist/basic/ascii.hpp"
#include "sql_assist/syntax/lexer.hpp"

namespace sql_assist::lsp
{
namespace
{

constexpr std::array<std::string_view, 9> k_table_ref_words = {
  "FROM", "JOIN", "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "NATURAL", "INTO",
};

constexpr std::array<std::string_view, 18> k_column_ref_words = {
  "SELECT", "WHERE", "AND",  "OR",  "ON",      "HAVING", "SET",  "BY", "WHEN",
  "THEN",   "ELSE",  "CASE", "NOT", "BETWEEN", "LIKE",   "IN",   "IS", "DISTINCT",
};

// Clause heads that decide what a list after a trailing comma holds.
constexpr std::array<std::string_view, 5> k_column_list_heads = {
  "SELECT", "BY", "WHERE", "HAVING", "ON",
};
constexpr std::array<std::string_view, 2> k_table_list_heads = {"FROM", "JOIN"};

template <size_t N>
bool contains(const std::array<std::string_view, N> & words, std::string_view w)
{
  return std::find(words.begin(), words.end(), w) != words.end();
}

// Uppercased word for keywords and bare identifiers; empty for anything
// else so strings, quoted identifiers and comments never match.
std::string word_of(const syntax::Token & t)
{
  if (t.kind == syntax::TokenKind::Keyword) {
    return t.value;
  }
  if (t.kind == syntax::TokenKind::Identifier) {
    return ascii::to_upper(t.value);
  }
  return {};
}

}  // namespace

CompletionContextKind determine_context(std::string_view text_before_cursor)
{
  std::vector<syntax::Token> toks;
  for (auto & t : syntax::tokenize(text_before_cursor)) {
    if (!syntax::is_trivia(t.kind)) {
      toks.push_back(std::move(t));
    }
  }
  if (toks.empty()) {
    return CompletionContextKind::General;
  }

  const auto & last = toks.back();
  if (last.kind == syntax::TokenKind::Comma) {
    for (auto it = toks.rbegin(); it != toks.rend(); ++it) {
      const auto w = word_of(*it);
      if (contains(k_column_list_heads, w)) {
        return CompletionContextKind::ColumnRef;
      }
      if (contains(k_table_list_heads, w)) {
        return CompletionContextKind::TableRef;
      }
    }
    return CompletionContextKind::ColumnRef;
  }

  const auto w = word_of(last);
  if (w.empty()) {
    return CompletionContextKind::General;
  }
  if (contains(k_table_ref_words, w)) {
    return CompletionContextKind::TableRef;
  }
  if (contains(k_column_ref_words, w)) {
    return CompletionContextKind::ColumnRef;
  }
  if (w == "ORDER") {
    return CompletionContextKind::AfterOrder;
  }
  if (w == "GROUP") {
    return CompletionContextKind::AfterGroup;
  }
  return CompletionContextKind::General;
}

}  // namespace sql_assist::lsp
