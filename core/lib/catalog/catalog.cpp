// sql_assist/catalog/catalog.cpp - Stream list and schema payload parsing
#include "sql_assist/catalog/catalog.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace sql_assist::catalog
{

namespace
{

using json = nlohmann::json;

// Schema data types arrive either as a plain string ("Utf8") or as a
// structured type object ({"Timestamp": ["Millisecond", null]}).
std::string data_type_text(const json & field)
{
  const auto it = field.find("data_type");
  if (it == field.end()) {
    return "Unknown";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

}  // namespace

void Catalog::merge(const Catalog & other)
{
  for (const auto & name : other.table_names) {
    if (std::find(table_names.begin(), table_names.end(), name) == table_names.end()) {
      table_names.push_back(name);
    }
  }
  for (const auto & f : other.fields) {
    const bool known = std::any_of(
      fields.begin(), fields.end(), [&](const SchemaField & g) { return g.name == f.name; });
    if (!known) {
      fields.push_back(f);
    }
  }
}

CatalogLoadResult<std::vector<std::string>> parse_stream_list_json(std::string_view json_text)
{
  using Result = CatalogLoadResult<std::vector<std::string>>;

  json root;
  try {
    root = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    return Result::fail(std::string("invalid stream list JSON: ") + e.what());
  }

  if (!root.is_array()) {
    return Result::fail("stream list must be a JSON array");
  }

  std::vector<std::string> names;
  names.reserve(root.size());
  for (size_t i = 0; i < root.size(); ++i) {
    const auto & entry = root[i];
    if (entry.is_string()) {
      names.push_back(entry.get<std::string>());
      continue;
    }
    if (entry.is_object()) {
      const auto it = entry.find("name");
      if (it != entry.end() && it->is_string()) {
        names.push_back(it->get<std::string>());
        continue;
      }
    }
    return Result::fail("stream list entry " + std::to_string(i) + " has no \"name\" string");
  }
  return Result::ok(std::move(names));
}

CatalogLoadResult<std::vector<SchemaField>> parse_stream_schema_json(std::string_view json_text)
{
  using Result = CatalogLoadResult<std::vector<SchemaField>>;

  json root;
  try {
    root = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    return Result::fail(std::string("invalid stream schema JSON: ") + e.what());
  }

  const json * list = &root;
  if (root.is_object()) {
    const auto it = root.find("fields");
    if (it == root.end()) {
      return Result::fail("stream schema object has no \"fields\" member");
    }
    list = &*it;
  }
  if (!list->is_array()) {
    return Result::fail("stream schema fields must be a JSON array");
  }

  std::vector<SchemaField> fields;
  fields.reserve(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const auto & entry = (*list)[i];
    const auto name = entry.is_object() ? entry.find("name") : entry.end();
    if (!entry.is_object() || name == entry.end() || !name->is_string()) {
      return Result::fail("schema field " + std::to_string(i) + " has no \"name\" string");
    }
    fields.push_back(SchemaField{name->get<std::string>(), data_type_text(entry)});
  }
  return Result::ok(std::move(fields));
}

}  // namespace sql_assist::catalog
