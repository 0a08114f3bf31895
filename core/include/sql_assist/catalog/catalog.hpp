// sql_assist/catalog/catalog.hpp - Table names and schema fields for completion
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sql_assist::catalog
{

/// One column of a stream schema.
struct SchemaField
{
  std::string name;
  std::string data_type;

  [[nodiscard]] bool operator==(const SchemaField & other) const = default;
};

/// Everything completion knows about the remote server.
struct Catalog
{
  std::vector<std::string> table_names;
  std::vector<SchemaField> fields;

  [[nodiscard]] bool empty() const noexcept { return table_names.empty() && fields.empty(); }

  /// Append another catalog, skipping tables and fields already present by name.
  void merge(const Catalog & other);
};

// ============================================================================
// JSON payload parsing
// ============================================================================

template <typename T>
struct CatalogLoadResult
{
  bool success = false;
  T value;
  std::string error;

  static CatalogLoadResult ok(T v)
  {
    CatalogLoadResult r;
    r.success = true;
    r.value = std::move(v);
    return r;
  }

  static CatalogLoadResult fail(std::string msg)
  {
    CatalogLoadResult r;
    r.success = false;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Parse the server's stream list.
 *
 * Accepts a JSON array whose elements are either strings or objects with a
 * string "name" member.
 */
[[nodiscard]] CatalogLoadResult<std::vector<std::string>> parse_stream_list_json(
  std::string_view json_text);

/**
 * Parse a stream schema.
 *
 * Accepts `{"fields": [...]}` or a bare array of `{"name", "data_type"}`
 * objects. A non-string data_type is kept as compact JSON text; a missing
 * one reads as "Unknown".
 */
[[nodiscard]] CatalogLoadResult<std::vector<SchemaField>> parse_stream_schema_json(
  std::string_view json_text);

}  // namespace sql_assist::catalog
