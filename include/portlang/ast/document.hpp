// portlang/ast/document.hpp - PortfolioDocument
//
// The parsed document has four always-present sections. Individual fields
// are optional: a field that failed to parse is simply absent.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "portlang/ast/ast_enums.hpp"

namespace portlang
{

struct Horizon
{
  std::int64_t amount = 0;
  HorizonUnit unit = HorizonUnit::Years;

  [[nodiscard]] bool operator==(const Horizon & other) const noexcept
  {
    return amount == other.amount && unit == other.unit;
  }
  [[nodiscard]] bool operator!=(const Horizon & other) const noexcept { return !(*this == other); }
};

struct Configuration
{
  std::optional<std::string> name;
  std::optional<std::string> risk_profile;
  std::optional<Horizon> horizon;

  [[nodiscard]] bool operator==(const Configuration & other) const
  {
    return name == other.name && risk_profile == other.risk_profile && horizon == other.horizon;
  }
  [[nodiscard]] bool operator!=(const Configuration & other) const { return !(*this == other); }
};

/**
 * Ordered mapping AssetClass -> percentage.
 *
 * Entries keep first-assignment order. Assigning an asset class that is
 * already present overwrites its percentage in place.
 */
class Allocation
{
public:
  using Entry = std::pair<AssetClass, double>;
  using const_iterator = std::vector<Entry>::const_iterator;

  void set(AssetClass asset, double percentage);

  [[nodiscard]] std::optional<double> get(AssetClass asset) const noexcept;
  [[nodiscard]] bool contains(AssetClass asset) const noexcept { return get(asset).has_value(); }

  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] const std::vector<Entry> & entries() const noexcept { return entries_; }
  [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

  /// Sum of every percentage.
  [[nodiscard]] double total() const noexcept;

  /// Sum of the percentages assigned to high-risk classes.
  [[nodiscard]] double risk_exposure() const noexcept;

  /// Sum of the percentages assigned to fixed income and real-estate funds.
  [[nodiscard]] double conservative_exposure() const noexcept;

  [[nodiscard]] bool operator==(const Allocation & other) const { return entries_ == other.entries_; }
  [[nodiscard]] bool operator!=(const Allocation & other) const { return !(*this == other); }

private:
  std::vector<Entry> entries_;
};

struct Restrictions
{
  std::optional<double> max_volatility;
  std::optional<double> max_management_fee;

  [[nodiscard]] bool empty() const noexcept
  {
    return !max_volatility.has_value() && !max_management_fee.has_value();
  }

  [[nodiscard]] bool operator==(const Restrictions & other) const
  {
    return max_volatility == other.max_volatility &&
           max_management_fee == other.max_management_fee;
  }
  [[nodiscard]] bool operator!=(const Restrictions & other) const { return !(*this == other); }
};

struct RebalancePolicy
{
  std::optional<RebalanceFrequency> frequency;
  std::optional<double> tolerance;

  [[nodiscard]] bool empty() const noexcept
  {
    return !frequency.has_value() && !tolerance.has_value();
  }

  [[nodiscard]] bool operator==(const RebalancePolicy & other) const
  {
    return frequency == other.frequency && tolerance == other.tolerance;
  }
  [[nodiscard]] bool operator!=(const RebalancePolicy & other) const { return !(*this == other); }
};

/**
 * Root of a parsed portfolio.
 *
 * Built once by the parser and read-only afterwards. Semantic rules (sum of
 * 100%, profile thresholds) are not enforced here; the validator reports them.
 */
struct PortfolioDocument
{
  Configuration configuration;
  Allocation allocation;
  Restrictions restrictions;
  RebalancePolicy rebalance;

  [[nodiscard]] bool operator==(const PortfolioDocument & other) const
  {
    return configuration == other.configuration && allocation == other.allocation &&
           restrictions == other.restrictions && rebalance == other.rebalance;
  }
  [[nodiscard]] bool operator!=(const PortfolioDocument & other) const
  {
    return !(*this == other);
  }
};

}  // namespace portlang
