// portlang/sema/portfolio_validator.hpp - Semantic validation of a portfolio
//
// Runs a fixed battery of domain rules over a parsed document:
//   1. allocation presence and 100% sum
//   2. per-asset percentage range
//   3. risk-profile exposure thresholds
//   4. restriction bounds
// Every rule runs regardless of earlier failures.
//
#pragma once

#include <optional>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"

namespace portlang
{

/// Absolute tolerance used when comparing the allocation sum with 100.
inline constexpr double k_allocation_epsilon = 0.01;

// Risk exposure thresholds (percent).
inline constexpr double k_conservative_max_exposure = 30.0;
inline constexpr double k_moderate_min_exposure = 20.0;
inline constexpr double k_moderate_max_exposure = 70.0;
inline constexpr double k_aggressive_min_exposure = 50.0;

// Restriction bounds (percent).
inline constexpr double k_max_volatility_limit = 50.0;
inline constexpr double k_max_management_fee_limit = 5.0;

class PortfolioValidator
{
public:
  explicit PortfolioValidator(DiagnosticBag & diags) : diags_(diags) {}

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Validate a document. A null document reports SEM001.
   *
   * @return true iff this call raised no Error diagnostic. Errors already in
   *         the bag (from the lexer or parser) do not affect the result.
   */
  bool validate(const PortfolioDocument * document);
  bool validate(const std::optional<PortfolioDocument> & document)
  {
    return validate(document ? &*document : nullptr);
  }

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }

private:
  // ===========================================================================
  // Checks
  // ===========================================================================

  void check_allocation_sum(const Allocation & allocation);
  void check_percentage_ranges(const Allocation & allocation);
  void check_risk_profile(const PortfolioDocument & document);
  void check_restrictions(const Restrictions & restrictions);

  DiagnosticBag & diags_;
  bool has_errors_ = false;
};

}  // namespace portlang
