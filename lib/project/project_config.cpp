// portlang/project/project_config.cpp - Project configuration implementation
//
#include "portlang/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace portlang
{

namespace
{

std::optional<DiagnosticFormat> parse_diagnostic_format(const std::string & text)
{
  if (text == "text") return DiagnosticFormat::Text;
  if (text == "json") return DiagnosticFormat::Json;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(const std::string & text)
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty file is a valid, all-defaults configuration.
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'report' section
  if (root["report"]) {
    const auto & rep = root["report"];
    if (!rep.IsMap()) {
      return ConfigLoadResult::fail("report must be a map");
    }

    if (rep["format"]) {
      const auto text = rep["format"].as<std::string>();
      const auto format = parse_report_format(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid report.format: '" + text + "' (must be 'text', 'json' or 'xml')");
      }
      config.report.format = *format;
    }

    if (rep["output_dir"]) {
      config.report.output_dir = rep["output_dir"].as<std::string>();
    }
  }

  // Parse 'diagnostics' section
  if (root["diagnostics"]) {
    const auto & diag = root["diagnostics"];
    if (!diag.IsMap()) {
      return ConfigLoadResult::fail("diagnostics must be a map");
    }

    if (diag["format"]) {
      const auto text = diag["format"].as<std::string>();
      const auto format = parse_diagnostic_format(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid diagnostics.format: '" + text + "' (must be 'text' or 'json')");
      }
      config.diagnostics.format = *format;
    }

    if (diag["color"]) {
      const auto text = diag["color"].as<std::string>();
      const auto color = parse_color_mode(text);
      if (!color) {
        return ConfigLoadResult::fail(
          "invalid diagnostics.color: '" + text + "' (must be 'auto', 'always' or 'never')");
      }
      config.diagnostics.color = *color;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config_from_string(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

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

}  // namespace portlang
