// compdoc/project/project_config.hpp - Project configuration (compdoc.yaml)
//
// Parses and validates compdoc.yaml. Shared by the CLI and by embedders that
// want the same resolver limits.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "compdoc/sema/expander.hpp"
#include "compdoc/sema/group_selector.hpp"

namespace compdoc
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode : uint8_t {
  Auto,
  Always,
  Never,
};

/**
 * Project section: default scope and document snapshot.
 */
struct ProjectSection
{
  std::string id;

  /// Document snapshot path (relative to compdoc.yaml)
  std::optional<std::filesystem::path> store;
};

/**
 * Resolver section: traversal bounds and group ordering.
 */
struct ResolverConfig
{
  ExpansionLimits limits;
  GroupOrder group_order = GroupOrder::OldestFirst;
};

struct OutputConfig
{
  ColorMode color = ColorMode::Auto;
};

/**
 * Prompt-context assembly defaults.
 */
struct ContextConfig
{
  size_t max_tokens = 100000;
  size_t related_limit = 5;
};

/**
 * Complete project configuration (compdoc.yaml).
 */
struct ProjectConfig
{
  ProjectSection project;
  ResolverConfig resolver;
  OutputConfig output;
  ContextConfig context;

  /// Directory containing compdoc.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Absolute snapshot path, if configured
  [[nodiscard]] std::optional<std::filesystem::path> store_path() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

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
 * Load a project configuration from a compdoc.yaml file.
 *
 * @param config_path Path to compdoc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Load a project configuration from YAML text.
 *
 * @param yaml YAML document
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult load_project_config_from_string(
  std::string_view yaml, const std::filesystem::path & project_root);

/**
 * Find compdoc.yaml by searching upward from `start_dir` to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] std::optional<GroupOrder> parse_group_order(std::string_view text);
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view text);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "compdoc.yaml";

}  // namespace compdoc
