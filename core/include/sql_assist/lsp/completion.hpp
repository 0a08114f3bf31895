// sql_assist/lsp/completion.hpp - Prefix completion over SQL vocabularies
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sql_assist/basic/source_manager.hpp"
#include "sql_assist/catalog/catalog.hpp"

namespace sql_assist::lsp
{

enum class CompletionItemKind : uint8_t {
  Keyword,
  Function,
  Table,
  Column,
};

[[nodiscard]] constexpr std::string_view to_string(CompletionItemKind k) noexcept
{
  switch (k) {
    case CompletionItemKind::Keyword:
      return "keyword";
    case CompletionItemKind::Function:
      return "function";
    case CompletionItemKind::Table:
      return "table";
    case CompletionItemKind::Column:
      return "column";
  }
  return "keyword";
}

struct CompletionItem
{
  std::string display_text;
  CompletionItemKind kind = CompletionItemKind::Keyword;
  std::optional<std::string> detail;  // column data type
  std::string insert_text;            // tables insert the unquoted name

  /// One-letter tag shown next to the item: K, F, T or C.
  [[nodiscard]] std::string_view kind_label() const noexcept;

  [[nodiscard]] bool operator==(const CompletionItem & other) const = default;
};

struct CompletionResult
{
  std::vector<CompletionItem> items;
  std::string prefix;
  SourceRange prefix_range;  // byte range of `prefix` in the text
};

/**
 * Compute completion items for the word ending at `cursor`.
 *
 * The prefix is the run of [A-Za-z0-9_] immediately before the cursor
 * (clamped to the text). An empty prefix yields no items. Matching is a
 * case-insensitive prefix test; each vocabulary is sorted before it is
 * filtered. A lone item whose display text equals the prefix is dropped.
 */
[[nodiscard]] CompletionResult completions(
  std::string_view text, uint32_t cursor, gsl::span<const std::string> table_names,
  gsl::span<const catalog::SchemaField> schema_fields);

}  // namespace sql_assist::lsp
