#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "portlang/basic/diagnostic_codes.hpp"
#include "portlang/codegen/report_generator.hpp"
#include "portlang/driver/compiler.hpp"
#include "portlang/test_support/parse_helpers.hpp"

using portlang::CompileOptions;
using portlang::Compiler;
using portlang::DiagnosticCategory;
using portlang::Severity;
using portlang::test_support::compile;
using portlang::test_support::k_valid_portfolio;
using portlang::test_support::portfolio;

namespace code = portlang::diag_code;

namespace
{

class ThrowingRenderer final : public portlang::ReportRenderer
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "broken"; }
  [[nodiscard]] std::string_view file_extension() const noexcept override { return "txt"; }

  void render(const portlang::PortfolioDocument &, std::ostream & out) const override
  {
    out << "partial";
    throw std::runtime_error("disk full");
  }
};

}  // namespace

// ============================================================================
// compile()
// ============================================================================

TEST(DriverCompiler, ValidSourceCompilesCleanly)
{
  const auto result = compile(k_valid_portfolio);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_TRUE(result.document.has_value());
  EXPECT_EQ(result.document->allocation.size(), 5U);
}

TEST(DriverCompiler, CompileIsDeterministic)
{
  const std::string src = portfolio(
    "nome = \"X\"\n"
    "perfil = \"conservador\";\n"
    "alocação { ações_nacionais = 60%; renda_fixa = 50%; }\n"
    "restrições { volatilidade_maxima = 70%; }\n");

  const auto first = compile(src);
  const auto second = compile(src);

  EXPECT_EQ(first.document, second.document);
  EXPECT_EQ(first.diagnostics.all(), second.diagnostics.all());
  EXPECT_EQ(first.success, second.success);
  EXPECT_FALSE(first.success);
}

TEST(DriverCompiler, NoDocumentReportsMissingDocument)
{
  const auto result = compile("carteira");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.document.has_value());

  const auto all = result.diagnostics.all();
  ASSERT_EQ(all.size(), 2U);
  EXPECT_EQ(all[0].code, code::k_unexpected_token);
  EXPECT_EQ(all[1].code, code::k_missing_document);
}

TEST(DriverCompiler, MissingTerminatorRaisesExactlyOneSyntaxError)
{
  const auto result = compile(portfolio(
    "nome = \"X\"\n"
    "perfil = \"moderado\";\n"
    "alocação { renda_fixa = 60%; ações_nacionais = 40%; }\n"));

  ASSERT_EQ(result.diagnostics.size(), 1U);
  const auto & d = result.diagnostics.errors()[0];
  EXPECT_EQ(d.category, DiagnosticCategory::Syntactic);
  EXPECT_EQ(d.message, "expected `;`, found `perfil`");
  ASSERT_TRUE(result.document.has_value());
  EXPECT_EQ(result.document->configuration.risk_profile, std::optional<std::string>("moderado"));
}

TEST(DriverCompiler, UnsupportedSymbolDoesNotStopTheCompile)
{
  const auto result = compile(portfolio(
    "nome = \"X\"; #\n"
    "perfil = \"moderado\";\n"
    "alocação { renda_fixa = 60%; ações_nacionais = 40%; }\n"));

  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.errors()[0].category, DiagnosticCategory::Lexical);
  EXPECT_EQ(result.diagnostics.errors()[0].code, code::k_unrecognized_character);
  ASSERT_TRUE(result.document.has_value());
  EXPECT_EQ(result.document->configuration.risk_profile, std::optional<std::string>("moderado"));
  EXPECT_DOUBLE_EQ(result.document->allocation.total(), 100.0);
  EXPECT_FALSE(result.success);
}

TEST(DriverCompiler, WarningsDoNotFailTheCompile)
{
  const auto result = compile(portfolio("alocação { renda_fixa = 100%; }\n"));
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_warnings());
  EXPECT_EQ(result.diagnostics.count(code::k_missing_risk_profile), 1U);
}

TEST(DriverCompiler, VerboseLogging)
{
  std::ostringstream log;
  CompileOptions options;
  options.verbose = true;
  options.log = &log;

  const Compiler compiler(options);
  const auto result = compiler.compile(k_valid_portfolio);
  EXPECT_TRUE(result.success);

  const std::string text = log.str();
  EXPECT_NE(text.find("[portc] lexed "), std::string::npos);
  EXPECT_NE(text.find("[portc] parsed portfolio document"), std::string::npos);
  EXPECT_NE(text.find("[portc] validation passed"), std::string::npos);
}

TEST(DriverCompiler, QuietByDefault)
{
  std::ostringstream log;
  CompileOptions options;
  options.log = &log;

  const Compiler compiler(options);
  (void)compiler.compile(k_valid_portfolio);
  EXPECT_TRUE(log.str().empty());
}

// ============================================================================
// render_report()
// ============================================================================

TEST(DriverCompiler, RendersReportForCleanResult)
{
  const portlang::TextReportRenderer renderer{};
  const Compiler compiler({}, &renderer);
  EXPECT_TRUE(compiler.has_renderer());

  auto result = compiler.compile(k_valid_portfolio);
  std::ostringstream out;
  EXPECT_TRUE(compiler.render_report(result, out));

  EXPECT_NE(out.str().find("RELATÓRIO DE CARTEIRA DE INVESTIMENTOS"), std::string::npos);
  ASSERT_EQ(result.diagnostics.infos().size(), 1U);
  EXPECT_EQ(result.diagnostics.infos()[0].code, code::k_report_generated);
  EXPECT_EQ(result.diagnostics.infos()[0].severity, Severity::Info);
  EXPECT_TRUE(result.success);
}

TEST(DriverCompiler, ReportSkippedWhenThereAreErrors)
{
  const portlang::JsonReportRenderer renderer{};
  const Compiler compiler({}, &renderer);

  auto result = compiler.compile(portfolio("alocação { renda_fixa = 90%; }\n"));
  ASSERT_TRUE(result.document.has_value());
  ASSERT_TRUE(result.diagnostics.has_errors());

  const size_t before = result.diagnostics.size();
  std::ostringstream out;
  EXPECT_FALSE(compiler.render_report(result, out));
  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(result.diagnostics.size(), before);
}

TEST(DriverCompiler, MissingRendererIsAWarning)
{
  const Compiler compiler;
  EXPECT_FALSE(compiler.has_renderer());

  auto result = compiler.compile(k_valid_portfolio);
  std::ostringstream out;
  EXPECT_FALSE(compiler.render_report(result, out));
  EXPECT_TRUE(out.str().empty());

  ASSERT_EQ(result.diagnostics.warnings().size(), 1U);
  EXPECT_EQ(result.diagnostics.warnings()[0].code, code::k_renderer_unavailable);
  EXPECT_TRUE(result.success);
}

TEST(DriverCompiler, FailingRendererIsAnError)
{
  const ThrowingRenderer renderer{};
  const Compiler compiler({}, &renderer);

  auto result = compiler.compile(k_valid_portfolio);
  ASSERT_TRUE(result.success);

  std::ostringstream out;
  EXPECT_FALSE(compiler.render_report(result, out));
  EXPECT_TRUE(out.str().empty());
  EXPECT_FALSE(result.success);

  ASSERT_EQ(result.diagnostics.errors().size(), 1U);
  const auto & d = result.diagnostics.errors()[0];
  EXPECT_EQ(d.code, code::k_report_failed);
  EXPECT_EQ(d.category, DiagnosticCategory::Generation);
  EXPECT_EQ(d.message, "broken report generation failed: disk full");
}
