// cfgc/project/project_config.hpp - Project configuration (cfgc.yaml)
//
// Parses and validates cfgc.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cfgc
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Output format of a build.
enum class EmitFormat {
  Text,  ///< Canonical CFG text (`.cfg.txt`)
  Json,  ///< nlohmann::json dump (`.cfg.json`)
};

/// "text" / "json"; std::nullopt for anything else.
[[nodiscard]] std::optional<EmitFormat> parse_emit_format(std::string_view name);

[[nodiscard]] std::string_view to_string(EmitFormat format) noexcept;

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Source files to compile, relative to the project root
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";

  EmitFormat emit = EmitFormat::Text;
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
 * Complete project configuration (cfgc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing cfgc.yaml (for resolving relative paths)
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
 * Load a project configuration from a cfgc.yaml file.
 *
 * Fails on a missing file, invalid YAML, a non-list or non-string
 * `compiler.entry_points` and an unknown `compiler.emit` value.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search upward from `start_dir` (or the directory of a file) for cfgc.yaml.
 *
 * @return Path to cfgc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Text of a fresh cfgc.yaml for `cfgc init`.
[[nodiscard]] std::string default_project_config(std::string_view project_name);

inline constexpr const char * k_project_config_file_name = "cfgc.yaml";

}  // namespace cfgc
