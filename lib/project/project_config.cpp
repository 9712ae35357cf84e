// compdoc/project/project_config.cpp - Project configuration implementation
//
#include "compdoc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace compdoc
{

namespace
{

/// Read a positive integer field; sets `error` on failure.
bool read_positive(const YAML::Node & node, const char * name, size_t & out, std::string & error)
{
  if (!node[name]) {
    return true;
  }
  long long value = 0;
  try {
    value = node[name].as<long long>();
  } catch (const YAML::Exception &) {
    error = std::string(name) + " must be an integer";
    return false;
  }
  if (value < 1) {
    error = std::string(name) + " must be at least 1";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'project' section
  if (const auto proj = root["project"]) {
    if (proj["id"]) {
      config.project.id = proj["id"].as<std::string>();
    }
    if (proj["store"]) {
      config.project.store = proj["store"].as<std::string>();
    }
  }

  // Parse 'resolver' section
  if (const auto res = root["resolver"]) {
    std::string error;
    if (
      !read_positive(res, "max_depth", config.resolver.limits.max_depth, error) ||
      !read_positive(res, "max_expansions", config.resolver.limits.max_expansions, error)) {
      return ConfigLoadResult::fail("resolver." + error);
    }

    if (res["group_order"]) {
      const auto text = res["group_order"].as<std::string>();
      const auto order = parse_group_order(text);
      if (!order) {
        return ConfigLoadResult::fail(
          "invalid resolver.group_order: '" + text +
          "' (must be 'oldest_first' or 'newest_first')");
      }
      config.resolver.group_order = *order;
    }
  }

  // Parse 'output' section
  if (const auto out = root["output"]) {
    if (out["color"]) {
      const auto text = out["color"].as<std::string>();
      const auto mode = parse_color_mode(text);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')");
      }
      config.output.color = *mode;
    }
  }

  // Parse 'context' section
  if (const auto ctx = root["context"]) {
    std::string error;
    if (
      !read_positive(ctx, "max_tokens", config.context.max_tokens, error) ||
      !read_positive(ctx, "related_limit", config.context.related_limit, error)) {
      return ConfigLoadResult::fail("context." + error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<std::filesystem::path> ProjectConfig::store_path() const
{
  if (!project.store) {
    return std::nullopt;
  }
  if (project.store->is_absolute()) {
    return *project.store;
  }
  return project_root / *project.store;
}

std::optional<GroupOrder> parse_group_order(std::string_view text)
{
  if (text == "oldest_first") return GroupOrder::OldestFirst;
  if (text == "newest_first") return GroupOrder::NewestFirst;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view text)
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config_from_string(
  std::string_view yaml, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace compdoc
