#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "portlang/basic/source_manager.hpp"

namespace portlang::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Identifier,  // any identifier that is not a keyword (unused by the grammar)
  String,      // value is the string contents (without quotes)
  Number,      // value is std::int64_t or double

  // Punctuation
  Eq,
  LBrace,
  RBrace,
  Semicolon,
  Percent,

  // Section / field keywords
  KwCarteira,
  KwNome,
  KwPerfil,
  KwHorizonteTemporal,
  KwAlocacao,
  KwRestricoes,
  KwRebalanceamento,

  // Asset classes
  KwAcoesNacionais,
  KwAcoesInternacionais,
  KwFundosImobiliarios,
  KwFundosMultimercado,
  KwRendaFixa,

  // Restrictions
  KwVolatilidadeMaxima,
  KwTaxaAdministrativaMaxima,

  // Rebalancing
  KwFrequencia,
  KwTolerancia,

  // Time units
  KwAnos,
  KwMeses,

  // Rebalancing frequencies
  KwTrimestral,
  KwSemestral,
  KwAnual,
  KwMensal,
};

/// Absent, text (strings, identifiers, keywords), integer or floating-point number.
using TokenValue = std::variant<std::monostate, std::string, std::int64_t, double>;

struct Token
{
  TokenKind kind = TokenKind::Eof;
  TokenValue value;
  SourceLocation location;  // position of the token's first character

  [[nodiscard]] bool has_text() const noexcept
  {
    return std::holds_alternative<std::string>(value);
  }
  [[nodiscard]] std::string_view text() const noexcept
  {
    if (const auto * s = std::get_if<std::string>(&value)) {
      return *s;
    }
    return {};
  }

  [[nodiscard]] bool is_integer() const noexcept
  {
    return std::holds_alternative<std::int64_t>(value);
  }
  [[nodiscard]] double number() const noexcept
  {
    if (const auto * i = std::get_if<std::int64_t>(&value)) {
      return static_cast<double>(*i);
    }
    if (const auto * d = std::get_if<double>(&value)) {
      return *d;
    }
    return 0.0;
  }

  [[nodiscard]] bool operator==(const Token & other) const
  {
    return kind == other.kind && value == other.value && location == other.location;
  }
  [[nodiscard]] bool operator!=(const Token & other) const { return !(*this == other); }
};

/// Spelling used in diagnostics ("expected `;`, found `perfil`").
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::String:
      return "string";
    case TokenKind::Number:
      return "number";
    case TokenKind::Eq:
      return "=";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Percent:
      return "%";
    case TokenKind::KwCarteira:
      return "carteira";
    case TokenKind::KwNome:
      return "nome";
    case TokenKind::KwPerfil:
      return "perfil";
    case TokenKind::KwHorizonteTemporal:
      return "horizonte_temporal";
    case TokenKind::KwAlocacao:
      return "alocação";
    case TokenKind::KwRestricoes:
      return "restrições";
    case TokenKind::KwRebalanceamento:
      return "rebalanceamento";
    case TokenKind::KwAcoesNacionais:
      return "ações_nacionais";
    case TokenKind::KwAcoesInternacionais:
      return "ações_internacionais";
    case TokenKind::KwFundosImobiliarios:
      return "fundos_imobiliarios";
    case TokenKind::KwFundosMultimercado:
      return "fundos_multimercado";
    case TokenKind::KwRendaFixa:
      return "renda_fixa";
    case TokenKind::KwVolatilidadeMaxima:
      return "volatilidade_maxima";
    case TokenKind::KwTaxaAdministrativaMaxima:
      return "taxa_administrativa_maxima";
    case TokenKind::KwFrequencia:
      return "frequencia";
    case TokenKind::KwTolerancia:
      return "tolerancia";
    case TokenKind::KwAnos:
      return "anos";
    case TokenKind::KwMeses:
      return "meses";
    case TokenKind::KwTrimestral:
      return "trimestral";
    case TokenKind::KwSemestral:
      return "semestral";
    case TokenKind::KwAnual:
      return "anual";
    case TokenKind::KwMensal:
      return "mensal";
  }
  return "";
}

}  // namespace portlang::syntax
