// portlang/driver/compiler.cpp - Compiler driver implementation
//
#include "portlang/driver/compiler.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <exception>
#include <sstream>
#include <string>

#include "portlang/basic/diagnostic_codes.hpp"
#include "portlang/sema/portfolio_validator.hpp"
#include "portlang/syntax/frontend.hpp"

namespace portlang
{

void Compiler::log(std::string_view message) const
{
  if (options_.verbose && options_.log != nullptr) {
    fmt::print(*options_.log, "[portc] {}\n", message);
  }
}

CompileResult Compiler::compile(std::string_view source_text) const
{
  CompileResult result;

  log(fmt::format("compiling {} bytes", source_text.size()));

  ParseOutput parsed = parse_source(source_text, result.diagnostics);
  log(fmt::format("lexed {} tokens", parsed.token_count));
  log(parsed.document ? "parsed portfolio document" : "parser produced no document");

  result.document = std::move(parsed.document);

  // SEM001 is reported by the validator itself when there is no document.
  PortfolioValidator validator(result.diagnostics);
  const bool valid = validator.validate(result.document);
  log(fmt::format("validation {}", valid ? "passed" : "failed"));

  result.success = !result.diagnostics.has_errors();
  log(fmt::format(
    "{} error(s), {} warning(s), {} info(s)", result.diagnostics.errors().size(),
    result.diagnostics.warnings().size(), result.diagnostics.infos().size()));
  return result;
}

bool Compiler::render_report(CompileResult & result, std::ostream & out) const
{
  if (!result.document || result.diagnostics.has_errors()) {
    log("report skipped: compile has errors");
    return false;
  }

  if (renderer_ == nullptr) {
    result.diagnostics
      .report_warning(DiagnosticCategory::Generation, "no report renderer is available")
      .with_code(diag_code::k_renderer_unavailable)
      .with_suggestion("configure a report format (text, json or xml)");
    log("report skipped: no renderer");
    return false;
  }

  // Render into a buffer so a failing renderer leaves `out` untouched.
  std::ostringstream buffer;
  try {
    renderer_->render(*result.document, buffer);
  } catch (const std::exception & e) {
    result.diagnostics
      .report_error(
        DiagnosticCategory::Generation,
        fmt::format("{} report generation failed: {}", renderer_->name(), e.what()))
      .with_code(diag_code::k_report_failed);
    result.success = false;
    log(fmt::format("report failed: {}", e.what()));
    return false;
  }

  out << buffer.str();
  result.diagnostics
    .report_info(
      DiagnosticCategory::Generation, fmt::format("{} report generated", renderer_->name()))
    .with_code(diag_code::k_report_generated);
  log(fmt::format("{} report generated", renderer_->name()));
  return true;
}

}  // namespace portlang
