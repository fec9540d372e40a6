// callscope/project/project_config.cpp - Project configuration implementation
//
#include "callscope/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace callscope
{

namespace
{

/// Parse a non-negative budget value
bool parse_budget(const YAML::Node & node, const char * key, size_t & out, std::string & error)
{
  if (!node[key]) {
    return true;
  }
  const auto value = node[key].as<long long>();
  if (value < 0) {
    error = std::string("analysis.") + key + " must not be negative";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

/// Parse a single entry point
std::optional<EntryPointConfig> parse_entry_point(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "entry point must be a map";
    return std::nullopt;
  }

  EntryPointConfig ep;
  if (node["class"]) {
    ep.class_name = node["class"].as<std::string>();
  }
  if (node["method"]) {
    ep.method_name = node["method"].as<std::string>();
  }

  if (ep.class_name.empty() || ep.method_name.empty()) {
    error = "entry point must have both 'class' and 'method'";
    return std::nullopt;
  }

  return ep;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'project' section
  if (root["project"]) {
    const auto & pkg = root["project"];
    if (pkg["name"]) {
      config.project.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.project.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'program' section
  if (!root["program"] || !root["program"]["location"]) {
    return ConfigLoadResult::fail("program.location is required");
  }
  config.program_location = root["program"]["location"].as<std::string>();

  // Parse 'analysis' section
  if (root["analysis"]) {
    const auto & an = root["analysis"];

    if (an["resolution"]) {
      const auto text = an["resolution"].as<std::string>();
      const auto mode = parse_resolution_mode(text);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid analysis.resolution: '" + text +
          "' (must be 'name_only' or 'signature_aware')");
      }
      config.analysis.resolution = *mode;
    }

    std::string error;
    if (
      !parse_budget(an, "max_nodes", config.analysis.max_nodes, error) ||
      !parse_budget(an, "max_depth", config.analysis.max_depth, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];

    if (out["format"]) {
      const auto format = out["format"].as<std::string>();
      if (format == "text") {
        config.output.format = OutputFormat::Text;
      } else if (format == "json") {
        config.output.format = OutputFormat::Json;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + format + "' (must be 'text' or 'json')");
      }
    }

    if (out["store"]) {
      config.output.store = out["store"].as<std::string>();
    }
  }

  // Parse 'entry_points' section
  if (root["entry_points"]) {
    if (!root["entry_points"].IsSequence()) {
      return ConfigLoadResult::fail("entry_points must be a list");
    }
    for (const auto & ep_node : root["entry_points"]) {
      std::string ep_error;
      auto ep = parse_entry_point(ep_node, ep_error);
      if (!ep) {
        return ConfigLoadResult::fail("invalid entry point: " + ep_error);
      }
      config.entry_points.push_back(std::move(*ep));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<ResolutionMode> parse_resolution_mode(const std::string & text)
{
  if (text == "name_only") return ResolutionMode::NameOnly;
  if (text == "signature_aware") return ResolutionMode::SignatureAware;
  return std::nullopt;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  const auto status = fs::status(config_path, ec);
  if (status.type() == fs::file_type::not_found) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }
  if (ec) {
    return ConfigLoadResult::fail(
      "cannot access configuration file " + config_path.string() + ": " + ec.message());
  }
  if (!fs::is_regular_file(status)) {
    return ConfigLoadResult::fail("configuration path is not a file: " + config_path.string());
  }

  const fs::path absolute_path = fs::absolute(config_path, ec);
  if (ec) {
    return ConfigLoadResult::fail(
      "cannot resolve configuration path " + config_path.string() + ": " + ec.message());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, absolute_path.parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    // Unreadable directories are treated like ones without a config
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace callscope
