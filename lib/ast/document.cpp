// portlang/ast/document.cpp - PortfolioDocument helpers
#include "portlang/ast/document.hpp"

#include <algorithm>
#include <cctype>

namespace portlang
{

// ============================================================================
// Enumerations
// ============================================================================

std::string_view keyword_spelling(AssetClass asset) noexcept
{
  switch (asset) {
    case AssetClass::DomesticEquities:
      return "ações_nacionais";
    case AssetClass::InternationalEquities:
      return "ações_internacionais";
    case AssetClass::RealEstateFunds:
      return "fundos_imobiliarios";
    case AssetClass::MultiMarketFunds:
      return "fundos_multimercado";
    case AssetClass::FixedIncome:
      return "renda_fixa";
  }
  return "";
}

std::string_view display_name(AssetClass asset) noexcept
{
  switch (asset) {
    case AssetClass::DomesticEquities:
      return "Ações Nacionais";
    case AssetClass::InternationalEquities:
      return "Ações Internacionais";
    case AssetClass::RealEstateFunds:
      return "Fundos Imobiliários";
    case AssetClass::MultiMarketFunds:
      return "Fundos Multimercado";
    case AssetClass::FixedIncome:
      return "Renda Fixa";
  }
  return "";
}

std::string_view keyword_spelling(HorizonUnit unit) noexcept
{
  return unit == HorizonUnit::Years ? "anos" : "meses";
}

std::string_view keyword_spelling(RebalanceFrequency frequency) noexcept
{
  switch (frequency) {
    case RebalanceFrequency::Monthly:
      return "mensal";
    case RebalanceFrequency::Quarterly:
      return "trimestral";
    case RebalanceFrequency::Semiannual:
      return "semestral";
    case RebalanceFrequency::Annual:
      return "anual";
  }
  return "";
}

namespace
{

bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

std::optional<RiskProfile> parse_risk_profile(std::string_view text) noexcept
{
  if (iequals_ascii(text, "conservador") || iequals_ascii(text, "conservative")) {
    return RiskProfile::Conservative;
  }
  if (iequals_ascii(text, "moderado") || iequals_ascii(text, "moderate")) {
    return RiskProfile::Moderate;
  }
  if (iequals_ascii(text, "arrojado") || iequals_ascii(text, "aggressive")) {
    return RiskProfile::Aggressive;
  }
  return std::nullopt;
}

std::string_view to_string(RiskProfile profile) noexcept
{
  switch (profile) {
    case RiskProfile::Conservative:
      return "conservador";
    case RiskProfile::Moderate:
      return "moderado";
    case RiskProfile::Aggressive:
      return "arrojado";
  }
  return "";
}

// ============================================================================
// Allocation
// ============================================================================

void Allocation::set(AssetClass asset, double percentage)
{
  for (auto & entry : entries_) {
    if (entry.first == asset) {
      entry.second = percentage;
      return;
    }
  }
  entries_.emplace_back(asset, percentage);
}

std::optional<double> Allocation::get(AssetClass asset) const noexcept
{
  for (const auto & entry : entries_) {
    if (entry.first == asset) {
      return entry.second;
    }
  }
  return std::nullopt;
}

double Allocation::total() const noexcept
{
  double sum = 0.0;
  for (const auto & entry : entries_) {
    sum += entry.second;
  }
  return sum;
}

double Allocation::risk_exposure() const noexcept
{
  double sum = 0.0;
  for (const auto & entry : entries_) {
    if (is_high_risk(entry.first)) {
      sum += entry.second;
    }
  }
  return sum;
}

double Allocation::conservative_exposure() const noexcept
{
  double sum = 0.0;
  for (const auto & entry : entries_) {
    if (is_conservative(entry.first)) {
      sum += entry.second;
    }
  }
  return sum;
}

}  // namespace portlang
