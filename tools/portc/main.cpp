// portc - PortLang Compiler Command Line Interface
//
// Usage:
//   portc check <file.port>
//   portc report <file.port> [-o path|-]
//   portc tokens <file.port>
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "portlang/ast/json_serializer.hpp"
#include "portlang/basic/diagnostic_printer.hpp"
#include "portlang/basic/source_manager.hpp"
#include "portlang/codegen/report_generator.hpp"
#include "portlang/driver/compiler.hpp"
#include "portlang/project/project_config.hpp"
#include "portlang/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "PortLang Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.port> [options]\n\n"
            << "Commands:\n"
            << "  check <file>               Check syntax and semantics\n"
            << "  report <file>              Check and generate a portfolio report\n"
            << "  tokens <file>              Dump the token stream\n\n"
            << "Options:\n"
            << "  -o, --output <path|->      Report output file ('-' for stdout)\n"
            << "  --format <text|json>       Diagnostics output format\n"
            << "  --report-format <fmt>      Report format: text, json or xml\n"
            << "  --config <path>            Use this portc.yaml\n"
            << "  --no-color                 Disable colored diagnostics\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -h, --help                 Show this help message\n";
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
  std::optional<std::string> diagnostic_format;
  std::optional<std::string> report_format;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

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
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.diagnostic_format = argv[++i];
      }
    } else if (arg == "--report-format") {
      if (i + 1 < argc) {
        args.report_format = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
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
// Configuration
// ============================================================================

// Loads --config, or the nearest portc.yaml, or falls back to defaults.
// Command-line overrides are applied on top.
std::optional<portlang::ProjectConfig> resolve_config(const CommandArgs & args)
{
  portlang::ProjectConfig config;
  config.project_root = fs::current_path();

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = portlang::find_project_config(fs::current_path());
  }

  if (config_path) {
    auto loaded = portlang::load_project_config(*config_path);
    if (!loaded.success) {
      fmt::print(std::cerr, "error: {}\n", loaded.error);
      return std::nullopt;
    }
    if (args.verbose) {
      fmt::print(std::cerr, "Using configuration: {}\n", config_path->string());
    }
    config = std::move(loaded.config);
  }

  if (args.diagnostic_format) {
    if (*args.diagnostic_format == "text") {
      config.diagnostics.format = portlang::DiagnosticFormat::Text;
    } else if (*args.diagnostic_format == "json") {
      config.diagnostics.format = portlang::DiagnosticFormat::Json;
    } else {
      fmt::print(
        std::cerr, "error: invalid --format '{}' (must be 'text' or 'json')\n",
        *args.diagnostic_format);
      return std::nullopt;
    }
  }

  if (args.report_format) {
    const auto format = portlang::parse_report_format(*args.report_format);
    if (!format) {
      fmt::print(
        std::cerr, "error: invalid --report-format '{}' (must be 'text', 'json' or 'xml')\n",
        *args.report_format);
      return std::nullopt;
    }
    config.report.format = *format;
  }

  if (args.no_color) {
    config.diagnostics.color = portlang::ColorMode::Never;
  }

  return config;
}

// ============================================================================
// Input
// ============================================================================

std::optional<portlang::SourceFile> read_source(const std::string & input_file)
{
  if (input_file.empty()) {
    std::cerr << "error: input file required\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::ifstream file(input_path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return portlang::SourceFile(fs::path(input_file), buffer.str());
}

// ============================================================================
// Diagnostics Output
// ============================================================================

void print_diagnostics(
  const portlang::DiagnosticBag & diagnostics, const portlang::SourceFile & source,
  const portlang::ProjectConfig & config)
{
  if (config.diagnostics.format == portlang::DiagnosticFormat::Json) {
    std::cout << portlang::to_json(diagnostics).dump(2) << "\n";
    return;
  }

  if (diagnostics.empty()) {
    return;
  }

  bool use_color = false;
  bool force_color = false;
  switch (config.diagnostics.color) {
    case portlang::ColorMode::Auto:
      use_color = isatty(fileno(stderr)) != 0;
      break;
    case portlang::ColorMode::Always:
      use_color = true;
      force_color = true;
      break;
    case portlang::ColorMode::Never:
      break;
  }

  portlang::DiagnosticPrinter printer(std::cerr, use_color, force_color);
  printer.print_all(diagnostics, source);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  const auto source = read_source(args.input_file);
  if (!source) {
    return 1;
  }

  if (args.verbose) {
    fmt::print(std::cerr, "Checking: {}\n", source->display_name());
  }

  portlang::CompileOptions options;
  options.verbose = args.verbose;
  options.log = &std::cerr;

  const portlang::Compiler compiler(options);
  const auto result = compiler.compile(source->content());

  print_diagnostics(result.diagnostics, *source, *config);

  if (!result.success) {
    return 1;
  }
  if (config->diagnostics.format == portlang::DiagnosticFormat::Text) {
    fmt::print(std::cout, "{}: OK\n", args.input_file);
  }
  return 0;
}

int cmd_report(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  const auto source = read_source(args.input_file);
  if (!source) {
    return 1;
  }

  if (args.verbose) {
    fmt::print(
      std::cerr, "Generating {} report: {}\n", portlang::to_string(config->report.format),
      source->display_name());
  }

  portlang::CompileOptions options;
  options.verbose = args.verbose;
  options.log = &std::cerr;

  const auto renderer = portlang::make_report_renderer(config->report.format);
  const portlang::Compiler compiler(options, renderer.get());
  auto result = compiler.compile(source->content());

  std::ostringstream report;
  const bool rendered = compiler.render_report(result, report);

  print_diagnostics(result.diagnostics, *source, *config);

  if (!result.success || !rendered) {
    return 1;
  }

  if (args.output_path == "-") {
    std::cout << report.str();
    return 0;
  }

  fs::path output_path;
  if (!args.output_path.empty()) {
    output_path = args.output_path;
  } else {
    output_path = config->resolved_output_dir() /
                  portlang::default_report_file_name(*result.document, renderer->file_extension());
  }

  std::error_code ec;
  if (output_path.has_parent_path()) {
    fs::create_directories(output_path.parent_path(), ec);
    if (ec) {
      fmt::print(
        std::cerr, "error: failed to create directory {}: {}\n",
        output_path.parent_path().string(), ec.message());
      return 1;
    }
  }

  std::ofstream out(output_path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << output_path.string() << "\n";
    return 1;
  }
  out << report.str();
  if (!out) {
    std::cerr << "error: failed to write output file: " << output_path.string() << "\n";
    return 1;
  }

  std::cerr << "Generated: " << output_path.string() << "\n";
  return 0;
}

int cmd_tokens(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  const auto source = read_source(args.input_file);
  if (!source) {
    return 1;
  }

  portlang::DiagnosticBag diagnostics;
  const auto tokens = portlang::syntax::tokenize(source->content(), diagnostics);

  for (const auto & token : tokens) {
    fmt::print(
      std::cout, "{:>4}:{:<4} {:<16}", token.location.line, token.location.column,
      portlang::syntax::to_string(token.kind));
    if (token.has_text()) {
      fmt::print(std::cout, " \"{}\"", token.text());
    } else if (token.kind == portlang::syntax::TokenKind::Number) {
      fmt::print(std::cout, " {}", token.number());
    }
    fmt::print(std::cout, "\n");
  }

  print_diagnostics(diagnostics, *source, *config);
  return diagnostics.has_errors() ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "report") {
    return cmd_report(args);
  }

  if (args.command == "tokens") {
    return cmd_tokens(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
