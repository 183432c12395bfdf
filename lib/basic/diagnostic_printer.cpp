// portlang/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "portlang/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace portlang
{

namespace
{

// Byte length of the UTF-8 sequence introduced by `lead` (1 for stray bytes).
size_t utf8_width(unsigned char lead)
{
  if (lead >= 0xF0 && lead <= 0xF7) return 4;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xC0 && lead <= 0xDF) return 2;
  return 1;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color, bool force_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  } else if (force_color) {
    rang::setControlMode(rang::control::Force);
  } else {
    rang::setControlMode(rang::control::Auto);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  const std::string filename = source.display_name();
  if (diag.location) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, diag.location->line, diag.location->column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  // === Source snippet ===
  if (diag.location) {
    fmt::print(os_, "{}\n", gutter_pipe());
    print_source_line(source, *diag.location);
  }

  // === Help message ===
  if (diag.suggestion) {
    print_help(*diag.suggestion);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  for (const auto & d : diags.all()) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();

  if (errors == 0 && warnings == 0) {
    return;
  }

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::yellow);
  }
  if (errors > 0) {
    fmt::print(os_, "aborting due to {} error(s); {} warning(s) emitted", errors, warnings);
  } else {
    fmt::print(os_, "{} warning(s) emitted", warnings);
  }
  if (use_color_) {
    os_ << rang::fg::reset << rang::style::reset;
  }
  fmt::print(os_, "\n");
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
  }
}

void DiagnosticPrinter::print_source_line(const SourceFile & source, SourceLocation location)
{
  if (location.line == 0 || location.line > source.line_count()) {
    return;
  }
  const std::string_view line = source.get_line(location.line - 1);

  // Build cleaned line (tabs -> spaces) and the caret prefix in one pass;
  // the column counts code points, not bytes.
  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(line.size());
  uint32_t column = 1;
  for (size_t i = 0; i < line.size();) {
    const auto c = static_cast<unsigned char>(line[i]);
    const size_t width = std::min(utf8_width(c), line.size() - i);
    const bool before_caret = column < location.column;
    if (c == '\t') {
      cleaned_line += "    ";
      if (before_caret) {
        marker_prefix += "    ";
      }
    } else {
      cleaned_line.append(line.substr(i, width));
      if (before_caret) {
        marker_prefix += ' ';
      }
    }
    i += width;
    ++column;
  }
  // Past end of line (e.g. end of input): pad so the caret sits after the text.
  while (column < location.column) {
    marker_prefix += ' ';
    ++column;
  }

  // Print line number and source line
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", location.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", location.line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Marker line
  fmt::print(os_, "      {} {}", gutter_pipe_only(), marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^");
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace portlang
