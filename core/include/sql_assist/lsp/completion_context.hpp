#pragma once

#include <cstdint>
#include <string_view>

namespace sql_assist::lsp
{

enum class CompletionContextKind : uint8_t {
  General,     // anything may follow
  TableRef,    // a table (stream) name is expected
  ColumnRef,   // a column or expression is expected
  AfterOrder,  // right after ORDER
  AfterGroup,  // right after GROUP
};

[[nodiscard]] constexpr std::string_view to_string(CompletionContextKind k) noexcept
{
  switch (k) {
    case CompletionContextKind::General:
      return "general";
    case CompletionContextKind::TableRef:
      return "table";
    case CompletionContextKind::ColumnRef:
      return "column";
    case CompletionContextKind::AfterOrder:
      return "after_order";
    case CompletionContextKind::AfterGroup:
      return "after_group";
  }
  return "general";
}

// Classify what kind of word is expected next from the text preceding the
// cursor. The word being typed must already be cut off by the caller.
[[nodiscard]] CompletionContextKind determine_context(std::string_view text_before_cursor);

}  // namespace sql_assist::lsp
