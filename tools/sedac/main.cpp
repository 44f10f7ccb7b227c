// sedac - Seda parser command line interface
//
// Usage:
//   sedac check <file.s>...     parse and report errors
//   sedac print <file.s>...     print canonical source
//   sedac dump  <file.s>...     print the syntax tree
//   sedac json  <file.s>...     print the syntax tree as JSON
//   sedac --project             use seda.yaml (sources and output.format)
//
#include <fmt/core.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "seda/ast/ast_dumper.hpp"
#include "seda/ast/ast_printer.hpp"
#include "seda/ast/json_visitor.hpp"
#include "seda/basic/diagnostic_printer.hpp"
#include "seda/project/project_config.hpp"
#include "seda/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_parse_errors = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "Seda parser v0.1.0\n\n"
    "Usage: {} <command> [options] <file.s>...\n\n"
    "Commands:\n"
    "  check                    Parse and report errors\n"
    "  print                    Print canonical source\n"
    "  dump                     Print the syntax tree\n"
    "  json                     Print the syntax tree as JSON\n\n"
    "Options:\n"
    "  --project                Read seda.yaml from the current directory or a parent\n"
    "  --max-depth <n>          Nesting limit (default {})\n"
    "  --color, --no-color      Force or disable colored diagnostics\n"
    "  -v, --verbose            Verbose output\n"
    "  -h, --help               Show this help message\n",
    program_name, seda::syntax::k_default_max_depth);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::optional<uint32_t> max_depth;
  std::optional<bool> color;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  int i = 1;
  const std::string first = argv[1];
  if (!first.empty() && first[0] != '-') {
    args.command = first;
    i = 2;
  }

  for (; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--max-depth") {
      if (i + 1 >= argc) {
        args.error = "--max-depth requires a value";
        return args;
      }
      const std::string value = argv[++i];
      const auto depth = seda::parse_max_depth(value);
      if (!depth) {
        args.error = fmt::format("invalid --max-depth value '{}'", value);
        return args;
      }
      args.max_depth = *depth;
    } else if (arg == "--color") {
      args.color = true;
    } else if (arg == "--no-color") {
      args.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] == '-') {
      args.error = fmt::format("unknown option '{}'", arg);
      return args;
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Driver
// ============================================================================

struct RunSettings
{
  seda::OutputFormat format = seda::OutputFormat::Errors;
  seda::syntax::ParserOptions options;
  bool use_color = false;
  bool verbose = false;
};

std::optional<seda::OutputFormat> format_for_command(const std::string & command)
{
  if (command == "check") return seda::OutputFormat::Errors;
  if (command == "print") return seda::OutputFormat::Source;
  if (command == "dump") return seda::OutputFormat::Dump;
  if (command == "json") return seda::OutputFormat::Json;
  return std::nullopt;
}

bool resolve_color(seda::ColorMode mode, const std::optional<bool> & flag)
{
  if (flag) {
    return *flag;
  }
  switch (mode) {
    case seda::ColorMode::Always:
      return true;
    case seda::ColorMode::Never:
      return false;
    case seda::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Parse one file and emit the requested output. Returns the exit code.
int process_file(const fs::path & path, const RunSettings & settings)
{
  if (!fs::exists(path)) {
    fmt::print(stderr, "error: file not found: {}\n", path.string());
    return k_exit_usage;
  }
  auto text = read_file(path);
  if (!text) {
    fmt::print(stderr, "error: failed to open file: {}\n", path.string());
    return k_exit_usage;
  }

  if (settings.verbose) {
    fmt::print(stderr, "Parsing: {}\n", path.string());
  }

  const auto unit = seda::parse_source(path, std::move(*text), settings.options);

  if (unit->has_errors()) {
    seda::DiagnosticPrinter printer(std::cerr, settings.use_color);
    printer.print_all(unit->diags, unit->source);
    return k_exit_parse_errors;
  }

  switch (settings.format) {
    case seda::OutputFormat::Errors:
      fmt::print("{}: OK\n", path.string());
      break;
    case seda::OutputFormat::Source:
      fmt::print("{}\n", seda::to_source(unit->program));
      break;
    case seda::OutputFormat::Dump:
      fmt::print("{}", seda::dump_to_string(unit->program));
      break;
    case seda::OutputFormat::Json:
      fmt::print("{}\n", seda::to_json(unit->program).dump(2));
      break;
  }

  if (settings.verbose) {
    fmt::print(stderr, "  {} statements\n", unit->program->statements.size());
  }
  return k_exit_ok;
}

int run(const CommandArgs & args)
{
  RunSettings settings;
  settings.verbose = args.verbose;

  seda::ProjectConfig config;
  std::vector<fs::path> inputs(args.inputs.begin(), args.inputs.end());

  if (args.use_project) {
    auto config_path = seda::find_project_config(fs::current_path());
    if (!config_path) {
      fmt::print(stderr, "error: no {} found in current directory or parents\n",
                 seda::k_project_config_file_name);
      return k_exit_usage;
    }

    auto config_result = seda::load_project_config(*config_path);
    if (!config_result.success) {
      fmt::print(stderr, "error: {}\n", config_result.error);
      return k_exit_usage;
    }
    config = std::move(config_result.config);

    if (args.verbose) {
      fmt::print(stderr, "Project: {} ({})\n", config.package.name, config_path->string());
    }
    if (inputs.empty()) {
      inputs = config.resolved_sources();
    }
  }

  settings.format = config.output.format;
  if (!args.command.empty()) {
    const auto format = format_for_command(args.command);
    if (!format) {
      fmt::print(stderr, "error: unknown command '{}'\n", args.command);
      return k_exit_usage;
    }
    settings.format = *format;
  }

  settings.options = config.parser.to_options();
  if (args.max_depth) {
    settings.options.max_depth = *args.max_depth;
  }
  settings.use_color = resolve_color(config.output.color, args.color);

  if (inputs.empty()) {
    fmt::print(stderr, "error: no input files\n");
    return k_exit_usage;
  }

  int status = k_exit_ok;
  for (const auto & input : inputs) {
    const int rc = process_file(input, settings);
    // Usage/IO failures outrank parse errors.
    if (rc > status) {
      status = rc;
    }
  }
  return status;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    fmt::print(stderr, "error: {}\n", args.error);
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  return run(args);
}
