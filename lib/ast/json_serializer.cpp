// portlang/ast/json_serializer.cpp - JSON serialization implementation
//
#include "portlang/ast/json_serializer.hpp"

#include <string>

namespace portlang
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

template <typename T>
json j_opt(const std::optional<T> & v)
{
  if (!v) {
    return nullptr;
  }
  return json(*v);
}

json j_horizon(const std::optional<Horizon> & h)
{
  if (!h) {
    return nullptr;
  }
  return json{{"amount", h->amount}, {"unit", std::string(keyword_spelling(h->unit))}};
}

json j_allocation(const Allocation & allocation)
{
  json arr = json::array();
  for (const auto & [asset, percentage] : allocation) {
    arr.push_back(json{{"asset", std::string(keyword_spelling(asset))}, {"percentage", percentage}});
  }
  return arr;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

json to_json(const PortfolioDocument & document)
{
  const auto & config = document.configuration;
  const auto & rebalance = document.rebalance;

  json j_rebalance{{"frequency", nullptr}, {"tolerance", j_opt(rebalance.tolerance)}};
  if (rebalance.frequency) {
    j_rebalance["frequency"] = std::string(keyword_spelling(*rebalance.frequency));
  }

  return json{
    {"configuration",
     {{"name", j_opt(config.name)},
      {"risk_profile", j_opt(config.risk_profile)},
      {"horizon", j_horizon(config.horizon)}}},
    {"allocation", j_allocation(document.allocation)},
    {"restrictions",
     {{"max_volatility", j_opt(document.restrictions.max_volatility)},
      {"max_management_fee", j_opt(document.restrictions.max_management_fee)}}},
    {"rebalance", j_rebalance},
  };
}

json to_json(const Diagnostic & diagnostic)
{
  json j{
    {"code", diagnostic.code},
    {"category", std::string(to_string(diagnostic.category))},
    {"severity", std::string(to_string(diagnostic.severity))},
    {"message", diagnostic.message},
    {"line", nullptr},
    {"column", nullptr},
    {"suggestion", j_opt(diagnostic.suggestion)},
  };
  if (diagnostic.location) {
    j["line"] = diagnostic.location->line;
    j["column"] = diagnostic.location->column;
  }
  return j;
}

json to_json(const DiagnosticBag & diagnostics)
{
  json arr = json::array();
  for (const auto & d : diagnostics.all()) {
    arr.push_back(to_json(d));
  }
  return arr;
}

}  // namespace portlang
