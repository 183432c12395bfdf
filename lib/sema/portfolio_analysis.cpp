// portlang/sema/portfolio_analysis.cpp - Derived portfolio metrics
//
#include "portlang/sema/portfolio_analysis.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

#include "portlang/sema/portfolio_validator.hpp"

namespace portlang
{

namespace
{

constexpr size_t k_min_diversified_classes = 3;
constexpr double k_concentration_limit = 80.0;

bool profile_threshold_met(const Configuration & config, double exposure)
{
  if (!config.risk_profile) {
    return false;
  }
  const auto profile = parse_risk_profile(*config.risk_profile);
  if (!profile) {
    return false;
  }
  switch (*profile) {
    case RiskProfile::Conservative:
      return exposure <= k_conservative_max_exposure;
    case RiskProfile::Moderate:
      return exposure >= k_moderate_min_exposure && exposure <= k_moderate_max_exposure;
    case RiskProfile::Aggressive:
      return exposure >= k_aggressive_min_exposure;
  }
  return false;
}

std::vector<std::string> build_recommendations(
  const PortfolioDocument & document, const PortfolioAnalysis & a)
{
  std::vector<std::string> out;

  if (!document.allocation.empty()) {
    if (!a.total_is_complete) {
      if (a.total_allocated > 100.0) {
        out.push_back(fmt::format(
          "Ajustar alocação: reduzir {:.2f}% para totalizar 100%", a.total_allocated - 100.0));
      } else {
        out.push_back(fmt::format(
          "Completar alocação: adicionar {:.2f}% para totalizar 100%",
          100.0 - a.total_allocated));
      }
    }

    const auto profile = document.configuration.risk_profile
                           ? parse_risk_profile(*document.configuration.risk_profile)
                           : std::nullopt;
    if (profile == RiskProfile::Conservative && a.risk_exposure > k_conservative_max_exposure) {
      out.emplace_back(
        "Reduzir exposição a ativos de alto risco para adequar ao perfil conservador");
    } else if (
      profile == RiskProfile::Aggressive && a.risk_exposure < k_aggressive_min_exposure) {
      out.emplace_back("Considerar aumentar exposição a ativos de risco para perfil arrojado");
    }

    if (a.asset_class_count < k_min_diversified_classes) {
      out.emplace_back("Melhorar diversificação adicionando mais classes de ativos");
    }

    if (a.max_allocation > k_concentration_limit) {
      out.emplace_back("Reduzir concentração: nenhum ativo deveria representar mais de 80%");
    }
  }

  if (out.empty()) {
    out.emplace_back("Carteira bem estruturada, manter monitoramento regular");
    out.emplace_back("Revisar periodicamente conforme mudanças no mercado");
    out.emplace_back("Considerar rebalanceamento conforme tolerância definida");
  }
  return out;
}

}  // namespace

std::string_view display_name(DiversificationLevel level) noexcept
{
  switch (level) {
    case DiversificationLevel::Low:
      return "Baixa";
    case DiversificationLevel::Medium:
      return "Média";
    case DiversificationLevel::High:
      return "Alta";
  }
  return "";
}

std::string_view display_name(ExposureLevel level) noexcept
{
  switch (level) {
    case ExposureLevel::Low:
      return "Baixa";
    case ExposureLevel::Moderate:
      return "Moderada";
    case ExposureLevel::High:
      return "Alta";
  }
  return "";
}

DiversificationLevel classify_diversification(size_t asset_class_count) noexcept
{
  if (asset_class_count >= 4) {
    return DiversificationLevel::High;
  }
  if (asset_class_count >= 2) {
    return DiversificationLevel::Medium;
  }
  return DiversificationLevel::Low;
}

ExposureLevel classify_exposure(double percentage) noexcept
{
  if (percentage > 60.0) {
    return ExposureLevel::High;
  }
  if (percentage > 30.0) {
    return ExposureLevel::Moderate;
  }
  return ExposureLevel::Low;
}

PortfolioAnalysis analyze(const PortfolioDocument & document)
{
  const Allocation & allocation = document.allocation;

  PortfolioAnalysis a;
  a.asset_class_count = allocation.size();
  a.diversification = classify_diversification(a.asset_class_count);

  a.total_allocated = allocation.total();
  a.total_is_complete = std::fabs(a.total_allocated - 100.0) <= k_allocation_epsilon;

  a.risk_exposure = allocation.risk_exposure();
  a.risk_level = classify_exposure(a.risk_exposure);
  a.conservative_exposure = allocation.conservative_exposure();
  a.conservative_level = classify_exposure(a.conservative_exposure);

  for (const auto & entry : allocation) {
    a.max_allocation = std::max(a.max_allocation, entry.second);
  }

  a.profile_fit = profile_threshold_met(document.configuration, a.risk_exposure);

  a.sorted_allocation = allocation.entries();
  std::stable_sort(
    a.sorted_allocation.begin(), a.sorted_allocation.end(),
    [](const Allocation::Entry & x, const Allocation::Entry & y) { return x.second > y.second; });

  a.recommendations = build_recommendations(document, a);
  return a;
}

}  // namespace portlang
