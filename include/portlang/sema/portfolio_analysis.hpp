// portlang/sema/portfolio_analysis.hpp - Derived portfolio metrics
//
// Read-only analysis used by the report renderers. It never reports
// diagnostics; validation is PortfolioValidator's job.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "portlang/ast/document.hpp"

namespace portlang
{

enum class DiversificationLevel : uint8_t {
  Low,     ///< a single asset class (or none)
  Medium,  ///< 2-3 asset classes
  High,    ///< 4 or more asset classes
};

enum class ExposureLevel : uint8_t {
  Low,       ///< <= 30%
  Moderate,  ///< > 30%
  High,      ///< > 60%
};

[[nodiscard]] std::string_view display_name(DiversificationLevel level) noexcept;
[[nodiscard]] std::string_view display_name(ExposureLevel level) noexcept;

[[nodiscard]] DiversificationLevel classify_diversification(size_t asset_class_count) noexcept;
[[nodiscard]] ExposureLevel classify_exposure(double percentage) noexcept;

struct PortfolioAnalysis
{
  size_t asset_class_count = 0;
  DiversificationLevel diversification = DiversificationLevel::Low;

  double total_allocated = 0.0;
  bool total_is_complete = false;  ///< total within 0.01 of 100

  double risk_exposure = 0.0;
  ExposureLevel risk_level = ExposureLevel::Low;

  double conservative_exposure = 0.0;
  ExposureLevel conservative_level = ExposureLevel::Low;

  double max_allocation = 0.0;

  /// True when a recognised profile's threshold is satisfied.
  bool profile_fit = false;

  /// Allocation entries by percentage, largest first (stable).
  std::vector<Allocation::Entry> sorted_allocation;

  std::vector<std::string> recommendations;
};

[[nodiscard]] PortfolioAnalysis analyze(const PortfolioDocument & document);

}  // namespace portlang
