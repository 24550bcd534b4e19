// entres - Entity resolver command line interface
//
// Usage:
//   entres resolve <file.json> [--now <secs>] [--utc-offset <secs>]
//                  [--config <resolver.yaml>] [-o <out.json>] [--compact] [-v]
//
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "entity_resolver/basic/diagnostic_printer.hpp"
#include "entity_resolver/driver/batch_resolver.hpp"
#include "entity_resolver/project/resolver_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Entity Resolver v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  resolve <file.json>      Resolve a document of parsed values\n\n"
            << "Options:\n"
            << "  --now <secs>             Reference time in epoch seconds (default: now)\n"
            << "  --utc-offset <secs>      UTC offset of the reference (default: local clock)\n"
            << "  --config <path>          Use this resolver.yaml instead of searching for one\n"
            << "  -o, --output <path>      Write results to a file instead of stdout\n"
            << "  --compact                Compact JSON output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const entity_resolver::DiagnosticBag & diagnostics, const std::string & input_name)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  entity_resolver::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, input_name);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  std::optional<int64_t> now;
  std::optional<int32_t> utc_offset;
  std::string error;
  bool compact = false;
  bool verbose = false;
  bool show_help = false;
};

/// Parse a signed integer option value; false on trailing garbage or overflow
template <typename T>
bool parse_integer(const std::string & text, std::optional<T> & out)
{
  try {
    size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    if (
      value < static_cast<long long>(std::numeric_limits<T>::min()) ||
      value > static_cast<long long>(std::numeric_limits<T>::max())) {
      return false;
    }
    out = static_cast<T>(value);
    return true;
  } catch (const std::logic_error &) {
    // std::invalid_argument and std::out_of_range
    return false;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--now") {
      if (i + 1 >= argc || !parse_integer(argv[++i], args.now)) {
        args.error = "--now requires an integer number of seconds";
      }
    } else if (arg == "--utc-offset") {
      if (i + 1 >= argc || !parse_integer(argv[++i], args.utc_offset)) {
        args.error = "--utc-offset requires an integer number of seconds";
      }
    } else if (arg == "--compact") {
      args.compact = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_resolve(const CommandArgs & args)
{
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: entres resolve <file.json>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);

  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  entity_resolver::ResolveOptions options;
  options.now = args.now;
  options.utc_offset = args.utc_offset;
  options.verbose = args.verbose;

  // Explicit --config, otherwise search upward from the input file
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = entity_resolver::find_resolver_config(input_path);
  }

  if (config_path) {
    const auto config_result = entity_resolver::load_resolver_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }
    if (args.verbose) {
      std::cerr << "Using config: " << config_path->string() << "\n";
    }
    options.config = config_result.config;
  }

  const auto result = entity_resolver::BatchResolver::resolve_file(input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args.input_file);
  }

  if (!result.success) {
    return 1;
  }

  int indent = options.config ? options.config->output.indent : 2;
  if (args.compact) {
    indent = -1;
  }
  const std::string text = result.outputs.dump(indent);

  if (args.output_path.empty()) {
    std::cout << text << "\n";
  } else {
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return 1;
    }
    out << text << "\n";
  }

  if (args.verbose) {
    std::cerr << "Resolved " << result.resolved_count << " of " << result.outputs.size()
              << " values\n";
  }

  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "resolve") {
    return cmd_resolve(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
