#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "portlang/syntax/token.hpp"

namespace portlang::syntax
{

// NOTE: Surface keywords are case-sensitive and must match byte-for-byte,
// accents included (UTF-8).

inline constexpr std::array<std::pair<std::string_view, TokenKind>, 22> k_keywords = {{
  {"carteira", TokenKind::KwCarteira},
  {"nome", TokenKind::KwNome},
  {"perfil", TokenKind::KwPerfil},
  {"horizonte_temporal", TokenKind::KwHorizonteTemporal},
  {"alocação", TokenKind::KwAlocacao},
  {"restrições", TokenKind::KwRestricoes},
  {"rebalanceamento", TokenKind::KwRebalanceamento},
  {"ações_nacionais", TokenKind::KwAcoesNacionais},
  {"ações_internacionais", TokenKind::KwAcoesInternacionais},
  {"fundos_imobiliarios", TokenKind::KwFundosImobiliarios},
  {"fundos_multimercado", TokenKind::KwFundosMultimercado},
  {"renda_fixa", TokenKind::KwRendaFixa},
  {"volatilidade_maxima", TokenKind::KwVolatilidadeMaxima},
  {"taxa_administrativa_maxima", TokenKind::KwTaxaAdministrativaMaxima},
  {"frequencia", TokenKind::KwFrequencia},
  {"tolerancia", TokenKind::KwTolerancia},
  {"anos", TokenKind::KwAnos},
  {"meses", TokenKind::KwMeses},
  {"trimestral", TokenKind::KwTrimestral},
  {"semestral", TokenKind::KwSemestral},
  {"anual", TokenKind::KwAnual},
  {"mensal", TokenKind::KwMensal},
}};

[[nodiscard]] constexpr std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept
{
  for (const auto & entry : k_keywords) {
    if (entry.first == text) {
      return entry.second;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr bool is_asset_class_keyword(TokenKind k) noexcept
{
  return k == TokenKind::KwAcoesNacionais || k == TokenKind::KwAcoesInternacionais ||
         k == TokenKind::KwFundosImobiliarios || k == TokenKind::KwFundosMultimercado ||
         k == TokenKind::KwRendaFixa;
}

[[nodiscard]] constexpr bool is_time_unit_keyword(TokenKind k) noexcept
{
  return k == TokenKind::KwAnos || k == TokenKind::KwMeses;
}

[[nodiscard]] constexpr bool is_frequency_keyword(TokenKind k) noexcept
{
  return k == TokenKind::KwTrimestral || k == TokenKind::KwSemestral ||
         k == TokenKind::KwAnual || k == TokenKind::KwMensal;
}

}  // namespace portlang::syntax
