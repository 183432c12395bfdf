// portlang/ast/ast_enums.hpp - Portfolio document enumerations
//
// This header contains the closed enumerations used by the portfolio
// document: asset classes, time units, rebalancing frequencies and the
// recognised risk profiles.
//
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace portlang
{

// ============================================================================
// AssetClass - Allocation keys
// ============================================================================

/**
 * Investable asset classes accepted as allocation keys.
 */
enum class AssetClass : uint8_t {
  DomesticEquities,       ///< ações_nacionais
  InternationalEquities,  ///< ações_internacionais
  RealEstateFunds,        ///< fundos_imobiliarios
  MultiMarketFunds,       ///< fundos_multimercado
  FixedIncome,            ///< renda_fixa
};

inline constexpr std::array<AssetClass, 5> k_all_asset_classes = {
  AssetClass::DomesticEquities, AssetClass::InternationalEquities, AssetClass::RealEstateFunds,
  AssetClass::MultiMarketFunds, AssetClass::FixedIncome,
};

/// DSL keyword for the asset class (e.g. "renda_fixa").
[[nodiscard]] std::string_view keyword_spelling(AssetClass asset) noexcept;

/// Human-readable label used in reports (e.g. "Renda Fixa").
[[nodiscard]] std::string_view display_name(AssetClass asset) noexcept;

/// Domestic/international equities and multi-market funds.
[[nodiscard]] constexpr bool is_high_risk(AssetClass asset) noexcept
{
  return asset == AssetClass::DomesticEquities || asset == AssetClass::InternationalEquities ||
         asset == AssetClass::MultiMarketFunds;
}

/// Fixed income and real-estate funds.
[[nodiscard]] constexpr bool is_conservative(AssetClass asset) noexcept
{
  return asset == AssetClass::FixedIncome || asset == AssetClass::RealEstateFunds;
}

// ============================================================================
// Time horizon / rebalancing
// ============================================================================

enum class HorizonUnit : uint8_t {
  Years,   ///< anos
  Months,  ///< meses
};

[[nodiscard]] std::string_view keyword_spelling(HorizonUnit unit) noexcept;

enum class RebalanceFrequency : uint8_t {
  Monthly,     ///< mensal
  Quarterly,   ///< trimestral
  Semiannual,  ///< semestral
  Annual,      ///< anual
};

[[nodiscard]] std::string_view keyword_spelling(RebalanceFrequency frequency) noexcept;

// ============================================================================
// RiskProfile
// ============================================================================

/**
 * Risk profiles with exposure thresholds.
 *
 * The document stores the profile as free text; parse_risk_profile() maps it
 * to one of these (ASCII case-insensitive, Portuguese or English spelling).
 */
enum class RiskProfile : uint8_t {
  Conservative,
  Moderate,
  Aggressive,
};

[[nodiscard]] std::optional<RiskProfile> parse_risk_profile(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(RiskProfile profile) noexcept;

}  // namespace portlang
