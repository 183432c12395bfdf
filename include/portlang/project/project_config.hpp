// portlang/project/project_config.hpp - Project configuration (portc.yaml)
//
// Parses and validates portc.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "portlang/codegen/report_generator.hpp"

namespace portlang
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class DiagnosticFormat : uint8_t {
  Text,
  Json,
};

enum class ColorMode : uint8_t {
  Auto,
  Always,
  Never,
};

/**
 * Report section.
 */
struct ReportConfig
{
  ReportFormat format = ReportFormat::Text;

  /// Directory for generated reports (relative to portc.yaml)
  std::filesystem::path output_dir = ".";
};

/**
 * Diagnostics section.
 */
struct DiagnosticsConfig
{
  DiagnosticFormat format = DiagnosticFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (portc.yaml).
 */
struct ProjectConfig
{
  ReportConfig report;
  DiagnosticsConfig diagnostics;

  /// Directory containing portc.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// report.output_dir resolved against project_root
  [[nodiscard]] std::filesystem::path resolved_output_dir() const
  {
    if (report.output_dir.is_absolute() || project_root.empty()) {
      return report.output_dir;
    }
    return project_root / report.output_dir;
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
 * Load a project configuration from a portc.yaml file.
 *
 * @param config_path Path to portc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Load a project configuration from YAML text.
 *
 * @param yaml_text   Contents of a portc.yaml file
 * @param project_root Directory that relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult load_project_config_from_string(
  std::string_view yaml_text, const std::filesystem::path & project_root = {});

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to portc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "portc.yaml";

}  // namespace portlang
