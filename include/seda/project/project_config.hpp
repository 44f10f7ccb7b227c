// seda/project/project_config.hpp - Project configuration (seda.yaml)
//
// Parses and validates seda.yaml. Command-line flags override the values
// loaded here.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "seda/syntax/parser.hpp"

namespace seda
{

/// What `sedac` prints for each parsed file when no command overrides it.
enum class OutputFormat : uint8_t {
  Errors,  ///< diagnostics only
  Source,  ///< canonical source text
  Dump,    ///< indented tree
  Json,    ///< JSON tree
};

enum class ColorMode : uint8_t {
  Auto,  ///< color when stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s);
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view s);

/// Decimal value of `--max-depth`, in [1, UINT32_MAX].
[[nodiscard]] std::optional<uint32_t> parse_max_depth(std::string_view s);

struct PackageConfig
{
  std::string name;
  std::string version;
};

struct ParserConfig
{
  /// Nesting limit handed to the parser; must be > 0.
  uint32_t max_depth = syntax::k_default_max_depth;

  /// Synchronize after every failed statement inside `::` bodies.
  bool recover_in_blocks = false;

  [[nodiscard]] syntax::ParserOptions to_options() const noexcept
  {
    syntax::ParserOptions options;
    options.max_depth = max_depth;
    options.recover_in_blocks = recover_in_blocks;
    return options;
  }
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Errors;
  ColorMode color = ColorMode::Auto;
};

struct ProjectConfig
{
  PackageConfig package;
  ParserConfig parser;
  OutputConfig output;

  /// Script files, relative to project_root unless absolute.
  std::vector<std::filesystem::path> sources;

  /// Where seda.yaml was found.
  std::filesystem::path project_root;

  /// `sources` made absolute against project_root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_sources() const;
};

/// Either a usable config (`success`) or the reason it was rejected (`error`).
struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig config)
  {
    ConfigLoadResult result;
    result.success = true;
    result.config = std::move(config);
    return result;
  }

  static ConfigLoadResult fail(std::string message)
  {
    ConfigLoadResult result;
    result.error = std::move(message);
    return result;
  }
};

/**
 * Load a project configuration from a seda.yaml file.
 *
 * Unknown keys are ignored. Invalid values fail with a message naming the
 * offending key, e.g. "parser.max_depth must be a positive integer".
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Search for seda.yaml starting from start_dir (or its parent when it names
 * a file) and moving up to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "seda.yaml";

}  // namespace seda
