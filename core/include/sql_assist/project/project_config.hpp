// sql_assist/project/project_config.hpp - Project configuration (sql_assist.yaml)
//
// Parses and validates sql_assist.yaml files. The file supplies an offline
// catalog for completion and defaults for the command-line tool.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sql_assist/catalog/catalog.hpp"

namespace sql_assist
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode : uint8_t {
  Auto,  // color when stderr/stdout is a terminal
  Always,
  Never,
};

enum class OutputFormat : uint8_t {
  Text,
  Json,
};

/**
 * Catalog section: tables and fields listed inline, plus optional server
 * payload files (relative to sql_assist.yaml).
 */
struct CatalogConfig
{
  std::vector<std::string> tables;
  std::vector<catalog::SchemaField> fields;

  std::optional<std::filesystem::path> schema_json;
  std::optional<std::filesystem::path> streams_json;
};

struct OutputConfig
{
  ColorMode color = ColorMode::Auto;
  OutputFormat format = OutputFormat::Text;
};

/**
 * Complete project configuration (sql_assist.yaml).
 */
struct ProjectConfig
{
  CatalogConfig catalog;
  OutputConfig output;

  /// Directory containing sql_assist.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a sql_assist.yaml file.
 *
 * @param config_path Path to sql_assist.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find sql_assist.yaml by searching upward from start_dir to the
 * filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Assemble the completion catalog described by `config`.
 *
 * Inline tables and fields come first; the stream list and schema files,
 * when configured, are read and merged after them.
 */
[[nodiscard]] catalog::CatalogLoadResult<catalog::Catalog> load_catalog(
  const ProjectConfig & config);

/// "auto" | "always" | "never"
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view s);

/// "text" | "json"
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s);

inline constexpr const char * k_project_config_file_name = "sql_assist.yaml";

}  // namespace sql_assist
