#include "portlang/syntax/parser.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "portlang/basic/diagnostic_codes.hpp"
#include "portlang/syntax/keywords.hpp"

namespace portlang::syntax
{
namespace
{

[[nodiscard]] std::string describe_expected(TokenKind k)
{
  switch (k) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::String:
      return "a string literal";
    case TokenKind::Number:
      return "a number";
    case TokenKind::Identifier:
      return "an identifier";
    default:
      break;
  }
  return fmt::format("`{}`", to_string(k));
}

[[nodiscard]] std::string describe_found(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::String:
      return fmt::format("string \"{}\"", t.text());
    case TokenKind::Number:
      return "number";
    case TokenKind::Identifier:
      return fmt::format("identifier `{}`", t.text());
    default:
      break;
  }
  return fmt::format("`{}`", to_string(t.kind));
}

[[nodiscard]] AssetClass asset_class_for(TokenKind k)
{
  switch (k) {
    case TokenKind::KwAcoesNacionais:
      return AssetClass::DomesticEquities;
    case TokenKind::KwAcoesInternacionais:
      return AssetClass::InternationalEquities;
    case TokenKind::KwFundosImobiliarios:
      return AssetClass::RealEstateFunds;
    case TokenKind::KwFundosMultimercado:
      return AssetClass::MultiMarketFunds;
    case TokenKind::KwRendaFixa:
      return AssetClass::FixedIncome;
    default:
      break;
  }
  throw ParseFault(fmt::format("`{}` is not an asset class keyword", to_string(k)));
}

[[nodiscard]] RebalanceFrequency frequency_for(TokenKind k)
{
  switch (k) {
    case TokenKind::KwMensal:
      return RebalanceFrequency::Monthly;
    case TokenKind::KwTrimestral:
      return RebalanceFrequency::Quarterly;
    case TokenKind::KwSemestral:
      return RebalanceFrequency::Semiannual;
    case TokenKind::KwAnual:
      return RebalanceFrequency::Annual;
    default:
      break;
  }
  throw ParseFault(fmt::format("`{}` is not a frequency keyword", to_string(k)));
}

// Whole-number horizon amount, or std::nullopt for fractional/out-of-range values.
[[nodiscard]] std::optional<std::int64_t> whole_amount(const Token & t)
{
  if (const auto * i = std::get_if<std::int64_t>(&t.value)) {
    return *i;
  }
  const double v = t.number();
  if (std::floor(v) != v || v > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(v);
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  if (tokens_.empty()) {
    throw ParseFault("token stream is empty");
  }
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

void Parser::error_expected(std::string_view expected, std::string_view suggestion)
{
  const Token & found = cur();
  diags_
    .report_error(
      DiagnosticCategory::Syntactic,
      fmt::format("expected {}, found {}", expected, describe_found(found)))
    .with_code(diag_code::k_unexpected_token)
    .with_location(found.location)
    .with_suggestion(std::string(suggestion));
}

std::optional<TokenValue> Parser::expect(TokenKind k)
{
  if (at(k)) {
    return advance().value;
  }
  const std::string what = describe_expected(k);
  error_expected(what, fmt::format("add {}", what));
  return std::nullopt;
}

std::optional<std::string> Parser::expect_string()
{
  auto v = expect(TokenKind::String);
  if (!v) {
    return std::nullopt;
  }
  auto * s = std::get_if<std::string>(&*v);
  if (s == nullptr) {
    throw ParseFault("string token carries no text");
  }
  return std::move(*s);
}

std::optional<double> Parser::expect_number()
{
  if (!at(TokenKind::Number)) {
    (void)expect(TokenKind::Number);
    return std::nullopt;
  }
  const Token & t = advance();
  if (std::holds_alternative<std::monostate>(t.value) || t.has_text()) {
    throw ParseFault("number token carries no numeric value");
  }
  return t.number();
}

void Parser::check_token_stream() const
{
  if (tokens_.empty()) {
    throw ParseFault("token stream is empty");
  }
  if (tokens_.back().kind != TokenKind::Eof) {
    throw ParseFault("token stream is not terminated by an end-of-input token");
  }
}

// ============================================================================
// Entry point
// ============================================================================

std::optional<PortfolioDocument> Parser::parse()
{
  try {
    check_token_stream();
    return parse_portfolio();
  } catch (const std::exception & e) {
    SourceLocation where;
    if (!tokens_.empty()) {
      where = (idx_ < tokens_.size() ? tokens_[idx_] : tokens_.back()).location;
    }
    diags_
      .report_error(
        DiagnosticCategory::Syntactic, fmt::format("internal parser error: {}", e.what()))
      .with_code(diag_code::k_internal_parser_error)
      .with_location(where);
    return std::nullopt;
  }
}

// ============================================================================
// Grammar
// ============================================================================

std::optional<PortfolioDocument> Parser::parse_portfolio()
{
  if (!expect(TokenKind::KwCarteira)) {
    return std::nullopt;
  }
  if (!expect(TokenKind::LBrace)) {
    return std::nullopt;
  }

  PortfolioDocument doc;
  doc.configuration = parse_configuration();

  auto allocation = parse_allocation();
  if (!allocation) {
    return std::nullopt;
  }
  doc.allocation = std::move(*allocation);

  if (at(TokenKind::KwRestricoes)) {
    doc.restrictions = parse_restrictions();
  }
  if (at(TokenKind::KwRebalanceamento)) {
    doc.rebalance = parse_rebalance();
  }

  // A missing closing brace is reported but the document is kept.
  if (expect(TokenKind::RBrace)) {
    (void)expect(TokenKind::Eof);
  }
  return doc;
}

Configuration Parser::parse_configuration()
{
  Configuration config;

  while (true) {
    if (at(TokenKind::KwNome)) {
      advance();
      if (expect(TokenKind::Eq)) {
        if (auto name = expect_string()) {
          config.name = std::move(*name);
        }
        (void)expect(TokenKind::Semicolon);
      }
    } else if (at(TokenKind::KwPerfil)) {
      advance();
      if (expect(TokenKind::Eq)) {
        if (auto profile = expect_string()) {
          config.risk_profile = std::move(*profile);
        }
        (void)expect(TokenKind::Semicolon);
      }
    } else if (at(TokenKind::KwHorizonteTemporal)) {
      advance();
      if (expect(TokenKind::Eq)) {
        parse_horizon(config);
        (void)expect(TokenKind::Semicolon);
      }
    } else {
      break;
    }
  }

  return config;
}

void Parser::parse_horizon(Configuration & config)
{
  // Number followed by a unit keyword: consume both.
  if (at(TokenKind::Number) && is_time_unit_keyword(cur(1).kind)) {
    const Token & amount_tok = advance();
    const Token & unit_tok = advance();

    const auto amount = whole_amount(amount_tok);
    if (!amount) {
      diags_
        .report_error(DiagnosticCategory::Syntactic, "time horizon must be a whole number")
        .with_code(diag_code::k_fractional_horizon)
        .with_location(amount_tok.location)
        .with_suggestion(fmt::format(
          "use a whole number of {}", unit_tok.kind == TokenKind::KwAnos ? "anos" : "meses"));
      return;
    }

    Horizon h;
    h.amount = *amount;
    h.unit = unit_tok.kind == TokenKind::KwAnos ? HorizonUnit::Years : HorizonUnit::Months;
    config.horizon = h;
    return;
  }

  if (expect_number()) {
    error_expected("`anos` or `meses`", "add a time unit (`anos` or `meses`) after the amount");
  }
}

std::optional<Allocation> Parser::parse_allocation()
{
  if (!expect(TokenKind::KwAlocacao)) {
    return std::nullopt;
  }
  if (!expect(TokenKind::LBrace)) {
    return std::nullopt;
  }

  Allocation allocation;

  while (is_asset_class_keyword(cur().kind)) {
    const AssetClass asset = asset_class_for(advance().kind);
    if (expect(TokenKind::Eq)) {
      if (const auto pct = parse_percentage()) {
        allocation.set(asset, *pct);
      }
      (void)expect(TokenKind::Semicolon);
    }
  }

  (void)expect(TokenKind::RBrace);
  return allocation;
}

Restrictions Parser::parse_restrictions()
{
  advance();  // restrições
  Restrictions restrictions;
  if (!expect(TokenKind::LBrace)) {
    return restrictions;
  }

  while (true) {
    if (at(TokenKind::KwVolatilidadeMaxima)) {
      advance();
      if (expect(TokenKind::Eq)) {
        if (const auto v = parse_percentage()) {
          restrictions.max_volatility = *v;
        }
        (void)expect(TokenKind::Semicolon);
      }
    } else if (at(TokenKind::KwTaxaAdministrativaMaxima)) {
      advance();
      if (expect(TokenKind::Eq)) {
        if (const auto v = parse_percentage()) {
          restrictions.max_management_fee = *v;
        }
        (void)expect(TokenKind::Semicolon);
      }
    } else {
      break;
    }
  }

  (void)expect(TokenKind::RBrace);
  return restrictions;
}

RebalancePolicy Parser::parse_rebalance()
{
  advance();  // rebalanceamento
  RebalancePolicy policy;
  if (!expect(TokenKind::LBrace)) {
    return policy;
  }

  if (at(TokenKind::KwFrequencia)) {
    advance();
    if (expect(TokenKind::Eq)) {
      if (is_frequency_keyword(cur().kind)) {
        policy.frequency = frequency_for(advance().kind);
      } else {
        error_expected(
          "a rebalancing frequency",
          "use one of `mensal`, `trimestral`, `semestral` or `anual`");
        // Skip the bad value itself so the terminator check below does not
        // report the same token twice.
        if (!at(TokenKind::Semicolon) && !at(TokenKind::RBrace) && !at_eof()) {
          advance();
        }
      }
      (void)expect(TokenKind::Semicolon);
    }
  }

  if (at(TokenKind::KwTolerancia)) {
    advance();
    if (expect(TokenKind::Eq)) {
      if (const auto v = parse_percentage()) {
        policy.tolerance = *v;
      }
      (void)expect(TokenKind::Semicolon);
    }
  }

  (void)expect(TokenKind::RBrace);
  return policy;
}

std::optional<double> Parser::parse_percentage()
{
  const auto value = expect_number();
  if (!value) {
    return std::nullopt;
  }
  if (!expect(TokenKind::Percent)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace portlang::syntax
