// portlang/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "portlang/basic/diagnostic.hpp"
#include "portlang/basic/source_manager.hpp"

namespace portlang
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[SYN001]: expected `;`, found `perfil`
 *     --> carteira.port:3:5
 *      |
 *    3 |     perfil = "moderado";
 *      |     ^
 *      |
 *      = help: add `;`
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   * @param force_color Emit colors even when `os` is not a terminal
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true, bool force_color = false);

  /**
   * Print a single diagnostic, with a snippet from `source` when the
   * diagnostic has a location.
   */
  void print(const Diagnostic & diag, const SourceFile & source);

  /**
   * Print all diagnostics from a DiagnosticBag (errors, warnings, infos).
   */
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /**
   * Print the trailing "N error(s), M warning(s)" line.
   */
  void print_summary(const DiagnosticBag & diags);

private:
  // Rust-style formatting helpers
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(const SourceFile & source, SourceLocation location);

  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace portlang
