// sql_assist/lsp/editor_service.hpp - JSON language service for SQL editors
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sql_assist/catalog/catalog.hpp"

namespace sql_assist::lsp
{

/**
 * Serverless language service for the SQL query editor.
 *
 * The host keeps documents in sync with set_document() and asks for
 * tokens, completions, highlighting and error locations. Every request
 * returns a JSON string.
 *
 * All positions are UTF-8 byte offsets. Ranges are serialized as
 * {startByte, endByte, startLine, startColumn, endLine, endColumn} with
 * 1-based lines and byte columns. Unknown URIs yield empty results.
 *
 * Not thread-safe; use one instance per editor thread.
 */
class EditorService
{
public:
  EditorService();
  ~EditorService();

  EditorService(const EditorService &) = delete;
  EditorService & operator=(const EditorService &) = delete;

  EditorService(EditorService && other) noexcept;
  EditorService & operator=(EditorService && other) noexcept;

  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  /// Tables and fields offered by completion_json().
  void set_catalog(catalog::Catalog catalog);
  [[nodiscard]] const catalog::Catalog & get_catalog() const;

  // Lexer output: {"uri", "tokens": [{"kind", "value", "range"}]}
  std::string tokens_json(std::string_view uri);

  // SELECT column list: {"uri", "found", "range"?, "text"?}
  std::string column_list_json(std::string_view uri);

  // Document text with the column list replaced: {"uri", "changed", "text"?}
  // The stored document is left as is; the host applies the edit.
  std::string replace_column_list_json(std::string_view uri, std::string_view replacement);

  // Remote error mapping:
  // {"uri", "position"?: {"line", "column"}, "range"?, "diagnostics": [...]}
  std::string error_highlight_json(std::string_view uri, std::string_view message);

  // Completion at a byte offset:
  // {"uri", "context", "prefix", "replaceRange",
  //  "items": [{"label", "kind", "kindLabel", "detail"?, "insertText"}]}
  std::string completion_json(std::string_view uri, uint32_t byte_offset);

  // Syntax highlighting: {"uri", "spans": [{"style", "range"}]}
  std::string highlight_json(std::string_view uri);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace sql_assist::lsp
