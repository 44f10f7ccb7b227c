// seda/project/project_config.cpp - Project configuration implementation
//
#include "seda/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace seda
{

std::optional<OutputFormat> parse_output_format(std::string_view s)
{
  if (s == "errors") return OutputFormat::Errors;
  if (s == "source") return OutputFormat::Source;
  if (s == "dump") return OutputFormat::Dump;
  if (s == "json") return OutputFormat::Json;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view s)
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

std::optional<uint32_t> parse_max_depth(std::string_view s)
{
  // strtoull accepts leading blanks and signs; the flag takes digits only.
  if (s.empty() || s[0] < '0' || s[0] > '9') return std::nullopt;
  const std::string text(s);
  char * end = nullptr;
  errno = 0;
  const unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
  if (*end != '\0' || errno == ERANGE || parsed == 0) return std::nullopt;
  if (parsed > std::numeric_limits<uint32_t>::max()) return std::nullopt;
  return static_cast<uint32_t>(parsed);
}

std::vector<std::filesystem::path> ProjectConfig::resolved_sources() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(sources.size());
  for (const auto & src : sources) {
    out.push_back(src.is_absolute() ? src : project_root / src);
  }
  return out;
}

namespace
{

/// Parse the 'parser' section
std::optional<std::string> parse_parser_section(const YAML::Node & node, ParserConfig & out)
{
  if (!node.IsMap()) {
    return "parser must be a map";
  }

  if (node["max_depth"]) {
    long long depth = 0;
    try {
      depth = node["max_depth"].as<long long>();
    } catch (const YAML::BadConversion &) {
      return "parser.max_depth must be a positive integer";
    }
    if (depth <= 0 || depth > static_cast<long long>(UINT32_MAX)) {
      return "parser.max_depth must be a positive integer";
    }
    out.max_depth = static_cast<uint32_t>(depth);
  }

  if (node["recover_in_blocks"]) {
    try {
      out.recover_in_blocks = node["recover_in_blocks"].as<bool>();
    } catch (const YAML::BadConversion &) {
      return "parser.recover_in_blocks must be true or false";
    }
  }
  return std::nullopt;
}

/// Parse the 'output' section
std::optional<std::string> parse_output_section(const YAML::Node & node, OutputConfig & out)
{
  if (!node.IsMap()) {
    return "output must be a map";
  }

  if (node["format"]) {
    const auto value = node["format"].as<std::string>();
    const auto format = parse_output_format(value);
    if (!format) {
      return "invalid output.format: '" + value + "' (must be 'errors', 'source', 'dump' or 'json')";
    }
    out.format = *format;
  }

  if (node["color"]) {
    const auto value = node["color"].as<std::string>();
    const auto color = parse_color_mode(value);
    if (!color) {
      return "invalid output.color: '" + value + "' (must be 'auto', 'always' or 'never')";
    }
    out.color = *color;
  }
  return std::nullopt;
}

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty document is a valid, all-defaults configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  if (root["parser"]) {
    if (auto err = parse_parser_section(root["parser"], config.parser)) {
      return ConfigLoadResult::fail(std::move(*err));
    }
  }

  if (root["output"]) {
    if (auto err = parse_output_section(root["output"], config.output)) {
      return ConfigLoadResult::fail(std::move(*err));
    }
  }

  if (root["sources"]) {
    if (!root["sources"].IsSequence()) {
      return ConfigLoadResult::fail("sources must be a list");
    }
    for (const auto & src : root["sources"]) {
      config.sources.emplace_back(src.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return build_config(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path project_root = fs::absolute(config_path).parent_path();
  try {
    return build_config(YAML::LoadFile(config_path.string()), project_root);
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace seda
