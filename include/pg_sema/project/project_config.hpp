// pg_sema/project/project_config.hpp - Project configuration (pg-sema.yaml)
//
// Parses and validates pg-sema.yaml project configuration files.
// Used by the CLI and by Analyzer::analyze_project.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pg_sema
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Schema source section.
 */
struct SchemaConfig
{
  /// Files, directories or `dir/**.sql` patterns, relative to the project root
  std::vector<std::string> include;

  /// Routines left out of the emitted result (unqualified or schema-qualified)
  std::vector<std::string> exclude_routines;
};

/**
 * Output section.
 */
struct OutputConfig
{
  /// JSON report written by `pg-sema infer`; empty if not configured
  std::filesystem::path report;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (pg-sema.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SchemaConfig schema;
  OutputConfig output;

  /// Directory containing pg-sema.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
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
 * Load a project configuration from a pg-sema.yaml file.
 *
 * @param config_path Path to pg-sema.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to pg-sema.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Expand `schema.include` into a list of files.
 *
 * Directories contribute every `*.sql` file below them; a `dir/**.ext`
 * pattern contributes every file below `dir` ending in `.ext`. Each entry's
 * files are sorted by path; duplicates are dropped.
 *
 * @param missing receives the entries that matched nothing
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_schema_files(
  const ProjectConfig & config, std::vector<std::string> & missing);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "pg-sema.yaml";

}  // namespace pg_sema
