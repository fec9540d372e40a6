// callscope/project/project_config.hpp - Project configuration (callscope.yaml)
//
// Parses and validates callscope.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "callscope/analysis/method_resolver.hpp"

namespace callscope
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * A class/method pair to analyze.
 */
struct EntryPointConfig
{
  std::string class_name;
  std::string method_name;
};

enum class OutputFormat {
  Text,
  Json,
};

/**
 * Analysis section.
 */
struct AnalysisConfig
{
  ResolutionMode resolution = ResolutionMode::NameOnly;

  /// 0 = unlimited
  size_t max_nodes = 0;
  size_t max_depth = 0;
};

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;

  /// JSON Lines file receiving one record per entry point (relative to project root)
  std::optional<std::filesystem::path> store;
};

/**
 * Project metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (callscope.yaml).
 */
struct ProjectConfig
{
  PackageConfig project;

  /// Program location (relative to callscope.yaml)
  std::filesystem::path program_location;

  AnalysisConfig analysis;
  OutputConfig output;
  std::vector<EntryPointConfig> entry_points;

  /// Directory containing callscope.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path resolved_program_location() const
  {
    return program_location.is_absolute() ? program_location : project_root / program_location;
  }

  [[nodiscard]] std::optional<std::filesystem::path> resolved_store() const
  {
    if (!output.store) return std::nullopt;
    return output.store->is_absolute() ? *output.store : project_root / *output.store;
  }
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
 * Load a project configuration from a callscope.yaml file.
 *
 * @param config_path Path to callscope.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to callscope.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Parse "name_only" / "signature_aware".
 */
[[nodiscard]] std::optional<ResolutionMode> parse_resolution_mode(const std::string & text);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "callscope.yaml";

}  // namespace callscope
