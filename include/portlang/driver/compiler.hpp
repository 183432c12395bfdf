// portlang/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and the tests; performs no file I/O.
//
#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"
#include "portlang/codegen/report_generator.hpp"

namespace portlang
{

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Enable verbose stage logging
  bool verbose = false;

  /// Sink for verbose logging (ignored unless verbose is set)
  std::ostream * log = nullptr;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Parsed document; absent when parsing failed structurally
  std::optional<PortfolioDocument> document;

  /// Collected diagnostics (errors, warnings, infos)
  DiagnosticBag diagnostics;

  /// Whether compilation succeeded (no errors)
  bool success = false;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the pipeline.
 *
 * The pipeline consists of:
 * 1. Lexing
 * 2. Parsing (best effort)
 * 3. Semantic validation
 * 4. Report rendering (on request, only for error-free results)
 *
 * The report renderer is an optional capability fixed at construction. The
 * renderer must outlive the Compiler.
 */
class Compiler
{
public:
  explicit Compiler(CompileOptions options = {}, const ReportRenderer * renderer = nullptr)
  : options_(options), renderer_(renderer)
  {
  }

  /**
   * Compile portfolio source text.
   *
   * Never throws for input-dependent conditions; every problem is reported
   * as a diagnostic in the result.
   */
  [[nodiscard]] CompileResult compile(std::string_view source_text) const;

  /**
   * Render a report for a successful result.
   *
   * Does nothing when the result has no document or has errors. Otherwise
   * adds GEN001 (no renderer), GEN003 (renderer failed) or GEN002 (report
   * written) to result.diagnostics.
   *
   * @return true if a report was written to `out`
   */
  bool render_report(CompileResult & result, std::ostream & out) const;

  [[nodiscard]] bool has_renderer() const noexcept { return renderer_ != nullptr; }
  [[nodiscard]] const ReportRenderer * renderer() const noexcept { return renderer_; }

private:
  void log(std::string_view message) const;

  CompileOptions options_;
  const ReportRenderer * renderer_;
};

}  // namespace portlang
