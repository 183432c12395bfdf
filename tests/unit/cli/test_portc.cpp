// test_portc.cpp - End-to-end tests for the portc command line tool

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

#include "portlang/test_support/parse_helpers.hpp"

namespace fs = std::filesystem;

using portlang::test_support::k_valid_portfolio;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, std::string_view s)
{
  std::ofstream out(p, std::ios::binary);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliRun
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs portc from `cwd` with `args` appended verbatim; captures both streams.
CliRun run_portc(const fs::path & cwd, const std::string & args)
{
  CliRun run;
#ifdef PORTLANG_PORTC_PATH
  const fs::path out_file = cwd / ".portc_stdout";
  const fs::path err_file = cwd / ".portc_stderr";
  const std::string cmd = "cd " + shell_quote(cwd.string()) + " && " +
                          shell_quote(PORTLANG_PORTC_PATH) + " " + args + " > " +
                          shell_quote(out_file.string()) + " 2> " +
                          shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());
#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    run.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    run.exit_code = WEXITSTATUS(rc);
  } else {
    run.exit_code = 128;
  }
#else
  run.exit_code = rc;
#endif
  run.out = read_all(out_file);
  run.err = read_all(err_file);
#else
  (void)cwd;
  (void)args;
#endif
  return run;
}

std::string portfolio_with_excess_allocation()
{
  std::string src(k_valid_portfolio);
  const std::string from = "renda_fixa = 40%;";
  src.replace(src.find(from), from.size(), "renda_fixa = 50%;");
  return src;
}

}  // namespace

#ifndef PORTLANG_PORTC_PATH
#define PORTLANG_REQUIRE_PORTC() GTEST_SKIP() << "PORTLANG_PORTC_PATH is not configured"
#else
#define PORTLANG_REQUIRE_PORTC() (void)0
#endif

// ============================================================================
// check
// ============================================================================

TEST(CliPortc, CheckValidFilePrintsOk)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_check_ok");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "check carteira.port --no-color");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out, "carteira.port: OK\n");
  EXPECT_TRUE(run.err.empty()) << run.err;
}

TEST(CliPortc, CheckWithErrorsExitsOne)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_check_err");
  write_all(dir / "carteira.port", portfolio_with_excess_allocation());

  const auto run = run_portc(dir, "check carteira.port --no-color");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_EQ(run.out.find("OK"), std::string::npos);
  EXPECT_NE(run.err.find("error[SEM003]"), std::string::npos) << run.err;
}

TEST(CliPortc, CheckJsonFormatPrintsDiagnosticArray)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_check_json");
  write_all(dir / "carteira.port", portfolio_with_excess_allocation());

  const auto run = run_portc(dir, "check carteira.port --format json");

  EXPECT_EQ(run.exit_code, 1);
  const auto j = nlohmann::json::parse(run.out);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1U);
  EXPECT_EQ(j[0]["code"], "SEM003");
  EXPECT_EQ(j[0]["severity"], "error");
}

TEST(CliPortc, CheckMissingFileFails)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_check_missing");

  const auto run = run_portc(dir, "check nao_existe.port");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.err.find("file not found"), std::string::npos) << run.err;
}

// ============================================================================
// Option validation
// ============================================================================

TEST(CliPortc, RejectsInvalidDiagnosticFormat)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_bad_format");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "check carteira.port --format yaml");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.err.find("invalid --format 'yaml'"), std::string::npos) << run.err;
  EXPECT_TRUE(run.out.empty());
}

TEST(CliPortc, RejectsInvalidReportFormat)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_bad_report_format");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "report carteira.port --report-format pdf -o -");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.err.find("invalid --report-format 'pdf'"), std::string::npos) << run.err;
  EXPECT_TRUE(run.out.empty());
}

TEST(CliPortc, UnknownCommandFails)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_unknown_cmd");

  const auto run = run_portc(dir, "compile carteira.port");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.err.find("unknown command 'compile'"), std::string::npos) << run.err;
}

// ============================================================================
// report
// ============================================================================

TEST(CliPortc, ReportToStdout)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_report_stdout");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "report carteira.port -o -");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out.rfind("RELATÓRIO DE CARTEIRA DE INVESTIMENTOS\n", 0), 0U);
  EXPECT_FALSE(fs::exists(dir / "carteira_teste_report.txt"));
}

TEST(CliPortc, ReportWritesDefaultFileName)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_report_default");
  write_all(dir / "portc.yaml", "report:\n  format: text\n");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "report carteira.port");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  const fs::path expected = dir / "carteira_teste_report.txt";
  ASSERT_TRUE(fs::exists(expected));
  EXPECT_NE(run.err.find("Generated: "), std::string::npos);
  EXPECT_NE(read_all(expected).find("Carteira Teste"), std::string::npos);
}

TEST(CliPortc, ReportWithErrorsWritesNothing)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_report_errors");
  write_all(dir / "portc.yaml", "report:\n  format: text\n");
  write_all(dir / "carteira.port", portfolio_with_excess_allocation());

  const auto run = run_portc(dir, "report carteira.port --no-color");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_FALSE(fs::exists(dir / "carteira_teste_report.txt"));
  EXPECT_NE(run.err.find("error[SEM003]"), std::string::npos) << run.err;
}

// ============================================================================
// Configuration lookup
// ============================================================================

TEST(CliPortc, FindsProjectConfigInParentDirectory)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path root = make_temp_dir("portc_config_search");
  const fs::path nested = root / "carteiras" / "2024";
  fs::create_directories(nested);
  write_all(root / "portc.yaml", "report:\n  format: json\n  output_dir: relatorios\n");
  write_all(nested / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(nested, "report carteira.port");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  const fs::path expected = root / "relatorios" / "carteira_teste_report.json";
  ASSERT_TRUE(fs::exists(expected)) << run.err;
  const auto j = nlohmann::json::parse(read_all(expected));
  EXPECT_TRUE(j.is_object());
}

TEST(CliPortc, ConfigFlagOverridesSearch)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path root = make_temp_dir("portc_config_flag");
  const fs::path alt = root / "alt";
  fs::create_directories(alt);
  write_all(root / "portc.yaml", "report:\n  format: json\n");
  write_all(alt / "custom.yaml", "report:\n  format: xml\n  output_dir: xml\n");
  write_all(root / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(root, "report carteira.port --config alt/custom.yaml");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_TRUE(fs::exists(alt / "xml" / "carteira_teste_report.xml")) << run.err;
  EXPECT_FALSE(fs::exists(root / "carteira_teste_report.json"));
}

TEST(CliPortc, ReportFormatFlagOverridesConfig)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_report_format_flag");
  write_all(dir / "portc.yaml", "report:\n  format: text\n");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "report carteira.port --report-format json -o -");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  const auto j = nlohmann::json::parse(run.out);
  EXPECT_TRUE(j.is_object());
}

TEST(CliPortc, MalformedConfigFails)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_config_bad");
  write_all(dir / "portc.yaml", "report:\n  format: pdf\n");
  write_all(dir / "carteira.port", k_valid_portfolio);

  const auto run = run_portc(dir, "check carteira.port");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.err.find("error: "), std::string::npos);
  EXPECT_TRUE(run.out.empty());
}

// ============================================================================
// tokens
// ============================================================================

TEST(CliPortc, TokensDumpsTheStream)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_tokens");
  write_all(dir / "carteira.port", "carteira {\n  nome = \"X\";\n}\n");

  const auto run = run_portc(dir, "tokens carteira.port");

  EXPECT_EQ(run.exit_code, 0) << run.err;
  EXPECT_EQ(run.out.rfind("   1:1    carteira", 0), 0U) << run.out;
  EXPECT_NE(run.out.find(" \"X\""), std::string::npos);
  EXPECT_NE(run.out.find("end of input"), std::string::npos);
}

TEST(CliPortc, TokensWithLexicalErrorExitsOne)
{
  PORTLANG_REQUIRE_PORTC();
  const fs::path dir = make_temp_dir("portc_tokens_err");
  write_all(dir / "carteira.port", "carteira # {\n");

  const auto run = run_portc(dir, "tokens carteira.port --no-color");

  EXPECT_EQ(run.exit_code, 1);
  EXPECT_NE(run.out.find("{"), std::string::npos);
  EXPECT_NE(run.err.find("error[LEX005]"), std::string::npos) << run.err;
}
