// portlang/test_support/parse_helpers.hpp - helpers for unit tests
//
// Single-call lex / parse / compile pipelines over in-memory source text.
// Each helper owns its own DiagnosticBag.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"
#include "portlang/driver/compiler.hpp"
#include "portlang/syntax/frontend.hpp"
#include "portlang/syntax/lexer.hpp"
#include "portlang/syntax/token.hpp"

namespace portlang::test_support
{

struct TestLexUnit
{
  std::vector<syntax::Token> tokens;
  DiagnosticBag diags;
};

struct TestParseUnit
{
  std::optional<PortfolioDocument> document;
  DiagnosticBag diags;
};

[[nodiscard]] inline TestLexUnit lex(std::string_view src)
{
  TestLexUnit out;
  out.tokens = syntax::tokenize(src, out.diags);
  return out;
}

[[nodiscard]] inline TestParseUnit parse(std::string_view src)
{
  TestParseUnit out;
  out.document = parse_source(src, out.diags).document;
  return out;
}

[[nodiscard]] inline CompileResult compile(std::string_view src)
{
  const Compiler compiler;
  return compiler.compile(src);
}

/// Wraps `body` in a complete `carteira { ... }` block.
[[nodiscard]] inline std::string portfolio(std::string_view body)
{
  std::string out = "carteira {\n";
  out += body;
  out += "}\n";
  return out;
}

/// A portfolio that compiles without errors, warnings or infos.
inline constexpr std::string_view k_valid_portfolio =
  "carteira {\n"
  "  nome = \"Carteira Teste\";\n"
  "  perfil = \"moderado\";\n"
  "  horizonte_temporal = 5 anos;\n"
  "\n"
  "  alocação {\n"
  "    renda_fixa = 40%;\n"
  "    ações_nacionais = 30%;\n"
  "    ações_internacionais = 15%;\n"
  "    fundos_imobiliarios = 10%;\n"
  "    fundos_multimercado = 5%;\n"
  "  }\n"
  "\n"
  "  restrições {\n"
  "    volatilidade_maxima = 15%;\n"
  "    taxa_administrativa_maxima = 1.5%;\n"
  "  }\n"
  "\n"
  "  rebalanceamento {\n"
  "    frequencia = trimestral;\n"
  "    tolerancia = 5%;\n"
  "  }\n"
  "}\n";

}  // namespace portlang::test_support
