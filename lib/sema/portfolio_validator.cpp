// portlang/sema/portfolio_validator.cpp - Portfolio validator implementation
//
#include "portlang/sema/portfolio_validator.hpp"

#include <fmt/format.h>

#include <cmath>

#include "portlang/basic/diagnostic_codes.hpp"

namespace portlang
{

bool PortfolioValidator::validate(const PortfolioDocument * document)
{
  const size_t errors_before = diags_.error_count();

  if (document == nullptr) {
    diags_.report_error(DiagnosticCategory::Semantic, "portfolio document is missing or invalid")
      .with_code(diag_code::k_missing_document);
    has_errors_ = true;
    return false;
  }

  check_allocation_sum(document->allocation);
  check_percentage_ranges(document->allocation);
  check_risk_profile(*document);
  check_restrictions(document->restrictions);

  has_errors_ = diags_.error_count() > errors_before;
  return !has_errors_;
}

void PortfolioValidator::check_allocation_sum(const Allocation & allocation)
{
  if (allocation.empty()) {
    diags_.report_error(DiagnosticCategory::Semantic, "no asset allocation defined")
      .with_code(diag_code::k_empty_allocation)
      .with_suggestion("add at least one asset class to the `alocação` section");
    return;
  }

  const double total = allocation.total();
  if (std::fabs(total - 100.0) <= k_allocation_epsilon) {
    return;
  }

  if (total > 100.0) {
    diags_
      .report_error(
        DiagnosticCategory::Semantic,
        fmt::format("allocation total is {}%, which exceeds 100%", total))
      .with_code(diag_code::k_allocation_exceeds)
      .with_suggestion(fmt::format("reduce the allocations by {:.2f}%", total - 100.0));
  } else {
    diags_
      .report_error(
        DiagnosticCategory::Semantic,
        fmt::format("allocation total is {}%, missing {:.2f}%", total, 100.0 - total))
      .with_code(diag_code::k_allocation_short)
      .with_suggestion(fmt::format("add {:.2f}% to other asset classes", 100.0 - total));
  }
}

void PortfolioValidator::check_percentage_ranges(const Allocation & allocation)
{
  for (const auto & [asset, percentage] : allocation) {
    if (percentage >= 0.0 && percentage <= 100.0) {
      continue;
    }
    diags_
      .report_error(
        DiagnosticCategory::Semantic,
        fmt::format(
          "allocation `{}`: {}% is outside the range [0, 100]", keyword_spelling(asset),
          percentage))
      .with_code(diag_code::k_percentage_out_of_range)
      .with_suggestion("use percentages between 0% and 100%");
  }
}

void PortfolioValidator::check_risk_profile(const PortfolioDocument & document)
{
  const auto & profile_text = document.configuration.risk_profile;
  if (!profile_text) {
    diags_.report_warning(DiagnosticCategory::Semantic, "risk profile is not defined")
      .with_code(diag_code::k_missing_risk_profile)
      .with_suggestion("set `perfil` to \"conservador\", \"moderado\" or \"arrojado\"");
    return;
  }

  const auto profile = parse_risk_profile(*profile_text);
  if (!profile) {
    // Unknown profiles have no thresholds.
    return;
  }

  const double exposure = document.allocation.risk_exposure();

  switch (*profile) {
    case RiskProfile::Conservative:
      if (exposure > k_conservative_max_exposure) {
        diags_
          .report_error(
            DiagnosticCategory::Semantic,
            fmt::format("conservative profile with {}% in high-risk assets", exposure))
          .with_code(diag_code::k_conservative_exposure)
          .with_suggestion(
            "reduce equities and multi-market funds to at most 30% of the portfolio");
      }
      break;
    case RiskProfile::Moderate:
      if (exposure < k_moderate_min_exposure || exposure > k_moderate_max_exposure) {
        diags_
          .report_warning(
            DiagnosticCategory::Semantic,
            fmt::format("moderate profile with {}% in high-risk assets", exposure))
          .with_code(diag_code::k_moderate_exposure)
          .with_suggestion("keep high-risk exposure between 20% and 70% for a moderate profile");
      }
      break;
    case RiskProfile::Aggressive:
      if (exposure < k_aggressive_min_exposure) {
        diags_
          .report_warning(
            DiagnosticCategory::Semantic,
            fmt::format("aggressive profile with only {}% in high-risk assets", exposure))
          .with_code(diag_code::k_aggressive_exposure)
          .with_suggestion("consider raising high-risk exposure to at least 50%");
      }
      break;
  }
}

void PortfolioValidator::check_restrictions(const Restrictions & restrictions)
{
  if (const auto & vol = restrictions.max_volatility) {
    if (*vol < 0.0 || *vol > k_max_volatility_limit) {
      diags_
        .report_error(
          DiagnosticCategory::Semantic, fmt::format("invalid maximum volatility: {}%", *vol))
        .with_code(diag_code::k_volatility_out_of_range)
        .with_suggestion("use a value between 0% and 50%");
    }
  }

  if (const auto & fee = restrictions.max_management_fee) {
    if (*fee < 0.0 || *fee > k_max_management_fee_limit) {
      diags_
        .report_error(
          DiagnosticCategory::Semantic, fmt::format("invalid maximum management fee: {}%", *fee))
        .with_code(diag_code::k_management_fee_out_of_range)
        .with_suggestion("use a value between 0% and 5%");
    }
  }
}

}  // namespace portlang
