// sql_assist/lsp/completion.cpp - Prefix completion over SQL vocabularies
#include "sql_assist/lsp/completion.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "sql_assist/basic/ascii.hpp"
#include "sql_assist/lsp/completion_context.hpp"
#include "sql_assist/syntax/keywords.hpp"

namespace sql_assist::lsp
{

namespace
{

bool has_prefix(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

class ItemCollector
{
public:
  explicit ItemCollector(std::string upper_prefix) : upper_prefix_(std::move(upper_prefix)) {}

  template <size_t N>
  void add_vocabulary(const std::array<std::string_view, N> & words, CompletionItemKind kind)
  {
    // The vocabularies are stored uppercase and sorted.
    for (const auto w : words) {
      if (has_prefix(w, upper_prefix_)) {
        push(std::string(w), kind, std::nullopt, std::string(w));
      }
    }
  }

  void add_tables(gsl::span<const std::string> table_names)
  {
    std::vector<std::string> sorted(table_names.begin(), table_names.end());
    std::sort(sorted.begin(), sorted.end());
    for (auto & name : sorted) {
      if (has_prefix(ascii::to_upper(name), upper_prefix_)) {
        push("\"" + name + "\"", CompletionItemKind::Table, std::nullopt, std::move(name));
      }
    }
  }

  void add_fields(gsl::span<const catalog::SchemaField> fields)
  {
    std::vector<catalog::SchemaField> sorted(fields.begin(), fields.end());
    std::stable_sort(
      sorted.begin(), sorted.end(),
      [](const catalog::SchemaField & a, const catalog::SchemaField & b) {
        return a.name < b.name;
      });
    for (auto & f : sorted) {
      if (has_prefix(ascii::to_upper(f.name), upper_prefix_)) {
        std::string insert = f.name;
        push(std::move(f.name), CompletionItemKind::Column, std::move(f.data_type), std::move(insert));
      }
    }
  }

  [[nodiscard]] std::vector<CompletionItem> take() { return std::move(items_); }

private:
  void push(
    std::string display, CompletionItemKind kind, std::optional<std::string> detail,
    std::string insert)
  {
    CompletionItem item;
    item.display_text = std::move(display);
    item.kind = kind;
    item.detail = std::move(detail);
    item.insert_text = std::move(insert);
    items_.push_back(std::move(item));
  }

  std::string upper_prefix_;
  std::vector<CompletionItem> items_;
};

}  // namespace

std::string_view CompletionItem::kind_label() const noexcept
{
  switch (kind) {
    case CompletionItemKind::Keyword:
      return "K";
    case CompletionItemKind::Function:
      return "F";
    case CompletionItemKind::Table:
      return "T";
    case CompletionItemKind::Column:
      return "C";
  }
  return "K";
}

CompletionResult completions(
  std::string_view text, uint32_t cursor, gsl::span<const std::string> table_names,
  gsl::span<const catalog::SchemaField> schema_fields)
{
  const auto end = static_cast<uint32_t>(std::min<size_t>(cursor, text.size()));

  uint32_t start = end;
  while (start > 0 && ascii::is_word_char(text[start - 1])) {
    --start;
  }

  CompletionResult result;
  result.prefix = std::string(text.substr(start, end - start));
  result.prefix_range = SourceRange(start, end);
  if (result.prefix.empty()) {
    return result;
  }

  const auto context = determine_context(text.substr(0, start));
  const auto upper_prefix = ascii::to_upper(result.prefix);

  ItemCollector collect(upper_prefix);
  switch (context) {
    case CompletionContextKind::TableRef:
      collect.add_tables(table_names);
      break;

    case CompletionContextKind::ColumnRef:
      collect.add_fields(schema_fields);
      collect.add_vocabulary(syntax::k_functions, CompletionItemKind::Function);
      break;

    case CompletionContextKind::AfterOrder:
    case CompletionContextKind::AfterGroup:
      if (has_prefix("BY", upper_prefix)) {
        result.items.push_back(
          CompletionItem{"BY", CompletionItemKind::Keyword, std::nullopt, "BY"});
      }
      break;

    case CompletionContextKind::General:
      collect.add_vocabulary(syntax::k_editor_keywords, CompletionItemKind::Keyword);
      collect.add_vocabulary(syntax::k_functions, CompletionItemKind::Function);
      collect.add_tables(table_names);
      collect.add_fields(schema_fields);
      break;
  }

  if (result.items.empty()) {
    result.items = collect.take();
  }

  // Nothing to offer when the only candidate is what was already typed.
  if (result.items.size() == 1 && ascii::to_upper(result.items.front().display_text) == upper_prefix) {
    result.items.clear();
  }

  return result;
}

}  // namespace sql_assist::lsp
