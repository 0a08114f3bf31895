// sql_assist/project/project_config.cpp - Project configuration implementation
//
#include "sql_assist/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace sql_assist
{

namespace
{

namespace fs = std::filesystem;

/// Parse a single `{ name, type }` field entry
std::optional<catalog::SchemaField> parse_field(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "field entry must be a map";
    return std::nullopt;
  }
  if (!node["name"]) {
    error = "field entry must have a 'name'";
    return std::nullopt;
  }

  catalog::SchemaField field;
  field.name = node["name"].as<std::string>();
  field.data_type = node["type"] ? node["type"].as<std::string>() : "Unknown";
  return field;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

fs::path resolve(const ProjectConfig & config, const fs::path & p)
{
  if (p.is_absolute()) {
    return p;
  }
  return config.project_root / p;
}

ConfigLoadResult parse_root(const YAML::Node & root, const fs::path & config_path)
{
  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // Parse 'catalog' section
  if (root["catalog"]) {
    const auto & cat = root["catalog"];

    if (cat["tables"]) {
      if (!cat["tables"].IsSequence()) {
        return ConfigLoadResult::fail("catalog.tables must be a list");
      }
      for (const auto & t : cat["tables"]) {
        config.catalog.tables.push_back(t.as<std::string>());
      }
    }

    if (cat["fields"]) {
      if (!cat["fields"].IsSequence()) {
        return ConfigLoadResult::fail("catalog.fields must be a list");
      }
      for (const auto & f : cat["fields"]) {
        std::string field_error;
        auto field = parse_field(f, field_error);
        if (!field) {
          return ConfigLoadResult::fail("invalid catalog field: " + field_error);
        }
        config.catalog.fields.push_back(std::move(*field));
      }
    }

    if (cat["schema_json"]) {
      config.catalog.schema_json = cat["schema_json"].as<std::string>();
    }
    if (cat["streams_json"]) {
      config.catalog.streams_json = cat["streams_json"].as<std::string>();
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];

    if (out["color"]) {
      const auto value = out["color"].as<std::string>();
      const auto mode = parse_color_mode(value);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + value + "' (must be 'auto', 'always' or 'never')");
      }
      config.output.color = *mode;
    }

    if (out["format"]) {
      const auto value = out["format"].as<std::string>();
      const auto format = parse_output_format(value);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + value + "' (must be 'text' or 'json')");
      }
      config.output.format = *format;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, config_path);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

catalog::CatalogLoadResult<catalog::Catalog> load_catalog(const ProjectConfig & config)
{
  using Result = catalog::CatalogLoadResult<catalog::Catalog>;

  catalog::Catalog cat;
  cat.table_names = config.catalog.tables;
  cat.fields = config.catalog.fields;

  if (config.catalog.streams_json) {
    const auto path = resolve(config, *config.catalog.streams_json);
    const auto text = read_file(path);
    if (!text) {
      return Result::fail("cannot read stream list: " + path.string());
    }
    auto streams = catalog::parse_stream_list_json(*text);
    if (!streams.success) {
      return Result::fail(path.string() + ": " + streams.error);
    }
    catalog::Catalog extra;
    extra.table_names = std::move(streams.value);
    cat.merge(extra);
  }

  if (config.catalog.schema_json) {
    const auto path = resolve(config, *config.catalog.schema_json);
    const auto text = read_file(path);
    if (!text) {
      return Result::fail("cannot read stream schema: " + path.string());
    }
    auto schema = catalog::parse_stream_schema_json(*text);
    if (!schema.success) {
      return Result::fail(path.string() + ": " + schema.error);
    }
    catalog::Catalog extra;
    extra.fields = std::move(schema.value);
    cat.merge(extra);
  }

  return Result::ok(std::move(cat));
}

std::optional<ColorMode> parse_color_mode(std::string_view s)
{
  if (s == "auto") {
    return ColorMode::Auto;
  }
  if (s == "always") {
    return ColorMode::Always;
  }
  if (s == "never") {
    return ColorMode::Never;
  }
  return std::nullopt;
}

std::optional<OutputFormat> parse_output_format(std::string_view s)
{
  if (s == "text") {
    return OutputFormat::Text;
  }
  if (s == "json") {
    return OutputFormat::Json;
  }
  return std::nullopt;
}

}  // namespace sql_assist
