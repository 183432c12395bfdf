// portlang/codegen/report_generator.cpp - Portfolio report renderers
#include "portlang/codegen/report_generator.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <tinyxml2.h>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

#include "portlang/ast/json_serializer.hpp"
#include "portlang/sema/portfolio_analysis.hpp"

namespace portlang
{

std::string_view to_string(ReportFormat format) noexcept
{
  switch (format) {
    case ReportFormat::Text:
      return "text";
    case ReportFormat::Json:
      return "json";
    case ReportFormat::Xml:
      return "xml";
  }
  return "";
}

std::optional<ReportFormat> parse_report_format(std::string_view text) noexcept
{
  if (text == "text") return ReportFormat::Text;
  if (text == "json") return ReportFormat::Json;
  if (text == "xml") return ReportFormat::Xml;
  return std::nullopt;
}

std::unique_ptr<ReportRenderer> make_report_renderer(ReportFormat format)
{
  switch (format) {
    case ReportFormat::Text:
      return std::make_unique<TextReportRenderer>();
    case ReportFormat::Json:
      return std::make_unique<JsonReportRenderer>();
    case ReportFormat::Xml:
      return std::make_unique<XmlReportRenderer>();
  }
  return nullptr;
}

namespace
{

constexpr double k_bar_step = 5.0;

std::string_view risk_label(AssetClass asset)
{
  return is_high_risk(asset) ? "Alto Risco" : "Baixo Risco";
}

std::string horizon_text(const std::optional<Horizon> & h)
{
  if (!h) {
    return "Não informado";
  }
  return fmt::format("{} {}", h->amount, keyword_spelling(h->unit));
}

std::string visual_bar(double percentage)
{
  const double clamped = std::clamp(percentage, 0.0, 100.0);
  const int blocks = static_cast<int>(clamped / k_bar_step);
  std::string bar;
  for (int i = 0; i < blocks; ++i) {
    bar += "█";
  }
  bar += "░";
  return bar;
}

// Latin-1 Supplement letter encoded as C3 xx (excluding the two math signs).
bool is_accented_trail(unsigned char c) { return c >= 0x80 && c <= 0xBF && c != 0x97 && c != 0xB7; }

bool is_ascii_alnum(unsigned char c)
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

}  // namespace

// ============================================================================
// TextReportRenderer
// ============================================================================

void TextReportRenderer::render(const PortfolioDocument & document, std::ostream & out) const
{
  const auto & config = document.configuration;
  const PortfolioAnalysis a = analyze(document);

  fmt::print(out, "RELATÓRIO DE CARTEIRA DE INVESTIMENTOS\n");
  fmt::print(out, "======================================\n\n");

  fmt::print(out, "INFORMAÇÕES GERAIS\n");
  fmt::print(out, "  {:<28}{}\n", "Nome da Carteira:", config.name.value_or("Não informado"));
  fmt::print(
    out, "  {:<28}{}\n", "Perfil de Risco:", config.risk_profile.value_or("Não informado"));
  fmt::print(out, "  {:<28}{}\n\n", "Horizonte Temporal:", horizon_text(config.horizon));

  fmt::print(out, "ALOCAÇÃO DE ATIVOS\n");
  if (document.allocation.empty()) {
    fmt::print(out, "  Nenhuma alocação definida\n\n");
  } else {
    fmt::print(out, "  {:<24}{:>12}  {}\n", "Classe de Ativo", "Percentual", "Classificação");
    for (const auto & [asset, percentage] : a.sorted_allocation) {
      fmt::print(
        out, "  {:<24}{:>11}%  {}\n", display_name(asset), percentage, risk_label(asset));
    }
    fmt::print(out, "  {:<24}{:>11}%\n\n", "TOTAL ALOCADO", a.total_allocated);
  }

  fmt::print(out, "ANÁLISE DA CARTEIRA\n");
  if (document.allocation.empty()) {
    fmt::print(out, "  Não é possível gerar análise sem alocação definida\n\n");
  } else {
    fmt::print(
      out, "  {:<30}{} ({})\n", "Total de Classes de Ativos:", a.asset_class_count,
      display_name(a.diversification));
    if (a.total_is_complete) {
      fmt::print(out, "  {:<30}{}% (Correta)\n", "Total Alocado:", a.total_allocated);
    } else {
      fmt::print(out, "  {:<30}{}% (Incorreta)\n", "Total Alocado:", a.total_allocated);
    }
    fmt::print(
      out, "  {:<30}{}% ({})\n", "Exposição ao Alto Risco:", a.risk_exposure,
      display_name(a.risk_level));
    fmt::print(
      out, "  {:<30}{}% ({})\n", "Exposição Conservadora:", a.conservative_exposure,
      display_name(a.conservative_level));
    fmt::print(
      out, "  {:<30}{}\n\n", "Compatibilidade com Perfil:",
      a.profile_fit ? "Adequado ao perfil" : "Requer atenção");

    fmt::print(out, "DISTRIBUIÇÃO VISUAL (cada █ = 5%)\n");
    for (const auto & [asset, percentage] : a.sorted_allocation) {
      fmt::print(out, "  {:<24}{} {}%\n", display_name(asset), visual_bar(percentage), percentage);
    }
    fmt::print(out, "\n");
  }

  const auto & restrictions = document.restrictions;
  if (!restrictions.empty()) {
    fmt::print(out, "RESTRIÇÕES E LIMITES\n");
    if (restrictions.max_volatility) {
      fmt::print(out, "  {:<30}{}%\n", "Volatilidade Máxima:", *restrictions.max_volatility);
    }
    if (restrictions.max_management_fee) {
      fmt::print(
        out, "  {:<30}{}%\n", "Taxa Administrativa Máxima:", *restrictions.max_management_fee);
    }
    fmt::print(out, "\n");
  }

  const auto & rebalance = document.rebalance;
  if (!rebalance.empty()) {
    fmt::print(out, "REBALANCEAMENTO\n");
    if (rebalance.frequency) {
      fmt::print(out, "  {:<30}{}\n", "Frequência:", keyword_spelling(*rebalance.frequency));
    }
    if (rebalance.tolerance) {
      fmt::print(out, "  {:<30}{}%\n", "Tolerância:", *rebalance.tolerance);
    }
    fmt::print(out, "\n");
  }

  fmt::print(out, "RECOMENDAÇÕES E OBSERVAÇÕES\n");
  for (const auto & rec : a.recommendations) {
    fmt::print(out, "  - {}\n", rec);
  }
}

// ============================================================================
// JsonReportRenderer
// ============================================================================

void JsonReportRenderer::render(const PortfolioDocument & document, std::ostream & out) const
{
  using nlohmann::json;

  const PortfolioAnalysis a = analyze(document);

  json sorted = json::array();
  for (const auto & [asset, percentage] : a.sorted_allocation) {
    sorted.push_back(json{
      {"asset", std::string(keyword_spelling(asset))},
      {"display_name", std::string(display_name(asset))},
      {"percentage", percentage},
      {"high_risk", is_high_risk(asset)},
    });
  }

  const json report{
    {"portfolio", to_json(document)},
    {"analysis",
     {
       {"asset_class_count", a.asset_class_count},
       {"diversification", std::string(display_name(a.diversification))},
       {"total_allocated", a.total_allocated},
       {"total_is_complete", a.total_is_complete},
       {"risk_exposure", a.risk_exposure},
       {"risk_level", std::string(display_name(a.risk_level))},
       {"conservative_exposure", a.conservative_exposure},
       {"conservative_level", std::string(display_name(a.conservative_level))},
       {"profile_fit", a.profile_fit},
       {"sorted_allocation", sorted},
     }},
    {"recommendations", a.recommendations},
  };

  out << report.dump(indent_) << '\n';
}

// ============================================================================
// XmlReportRenderer (tinyxml2)
// ============================================================================

void XmlReportRenderer::render(const PortfolioDocument & document, std::ostream & out) const
{
  const auto & config = document.configuration;
  const PortfolioAnalysis a = analyze(document);

  tinyxml2::XMLDocument doc;
  doc.InsertFirstChild(doc.NewDeclaration(R"(xml version="1.0" encoding="UTF-8")"));

  auto * root = doc.NewElement("PortfolioReport");
  doc.InsertEndChild(root);

  auto * cfg = doc.NewElement("Configuration");
  if (config.name) {
    cfg->SetAttribute("name", config.name->c_str());
  }
  if (config.risk_profile) {
    cfg->SetAttribute("risk_profile", config.risk_profile->c_str());
  }
  if (config.horizon) {
    cfg->SetAttribute("horizon", horizon_text(config.horizon).c_str());
  }
  root->InsertEndChild(cfg);

  auto * alloc = doc.NewElement("Allocation");
  alloc->SetAttribute("total", fmt::format("{}", a.total_allocated).c_str());
  for (const auto & [asset, percentage] : a.sorted_allocation) {
    auto * e = doc.NewElement("Asset");
    e->SetAttribute("class", std::string(keyword_spelling(asset)).c_str());
    e->SetAttribute("percentage", fmt::format("{}", percentage).c_str());
    e->SetAttribute("high_risk", is_high_risk(asset));
    alloc->InsertEndChild(e);
  }
  root->InsertEndChild(alloc);

  auto * analysis = doc.NewElement("Analysis");
  analysis->SetAttribute("asset_class_count", static_cast<unsigned>(a.asset_class_count));
  analysis->SetAttribute("diversification", std::string(display_name(a.diversification)).c_str());
  analysis->SetAttribute("total_is_complete", a.total_is_complete);
  analysis->SetAttribute("risk_exposure", fmt::format("{}", a.risk_exposure).c_str());
  analysis->SetAttribute("risk_level", std::string(display_name(a.risk_level)).c_str());
  analysis->SetAttribute(
    "conservative_exposure", fmt::format("{}", a.conservative_exposure).c_str());
  analysis->SetAttribute(
    "conservative_level", std::string(display_name(a.conservative_level)).c_str());
  analysis->SetAttribute("profile_fit", a.profile_fit);
  root->InsertEndChild(analysis);

  if (!document.restrictions.empty()) {
    auto * r = doc.NewElement("Restrictions");
    if (document.restrictions.max_volatility) {
      r->SetAttribute(
        "max_volatility", fmt::format("{}", *document.restrictions.max_volatility).c_str());
    }
    if (document.restrictions.max_management_fee) {
      r->SetAttribute(
        "max_management_fee",
        fmt::format("{}", *document.restrictions.max_management_fee).c_str());
    }
    root->InsertEndChild(r);
  }

  if (!document.rebalance.empty()) {
    auto * r = doc.NewElement("Rebalance");
    if (document.rebalance.frequency) {
      r->SetAttribute(
        "frequency", std::string(keyword_spelling(*document.rebalance.frequency)).c_str());
    }
    if (document.rebalance.tolerance) {
      r->SetAttribute("tolerance", fmt::format("{}", *document.rebalance.tolerance).c_str());
    }
    root->InsertEndChild(r);
  }

  auto * recs = doc.NewElement("Recommendations");
  for (const auto & rec : a.recommendations) {
    auto * e = doc.NewElement("Recommendation");
    e->SetText(rec.c_str());
    recs->InsertEndChild(e);
  }
  root->InsertEndChild(recs);

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  out << printer.CStr();
}

// ============================================================================
// File naming
// ============================================================================

std::string default_report_file_name(
  const PortfolioDocument & document, std::string_view extension)
{
  const std::string_view name =
    document.configuration.name ? std::string_view(*document.configuration.name) : "";

  std::string safe;
  for (size_t i = 0; i < name.size(); ++i) {
    const auto c = static_cast<unsigned char>(name[i]);
    if (is_ascii_alnum(c) || c == ' ' || c == '-' || c == '_') {
      safe.push_back(static_cast<char>(c));
      continue;
    }
    if (c == 0xC3 && i + 1 < name.size()) {
      const auto trail = static_cast<unsigned char>(name[i + 1]);
      if (is_accented_trail(trail)) {
        safe.push_back(name[i]);
        safe.push_back(name[i + 1]);
        ++i;
      }
    }
  }

  const auto first = safe.find_first_not_of(' ');
  const auto last = safe.find_last_not_of(' ');
  safe = (first == std::string::npos) ? std::string() : safe.substr(first, last - first + 1);

  for (size_t i = 0; i < safe.size(); ++i) {
    auto c = static_cast<unsigned char>(safe[i]);
    if (c == ' ') {
      safe[i] = '_';
    } else if (c >= 'A' && c <= 'Z') {
      safe[i] = static_cast<char>(c - 'A' + 'a');
    } else if (c == 0xC3 && i + 1 < safe.size()) {
      // Uppercase Latin-1 letters U+00C0..U+00DE map to U+00E0..U+00FE.
      c = static_cast<unsigned char>(safe[i + 1]);
      if (c >= 0x80 && c <= 0x9E) {
        safe[i + 1] = static_cast<char>(c + 0x20);
      }
      ++i;
    }
  }

  if (safe.empty()) {
    safe = "carteira";
  }
  return fmt::format("{}_report.{}", safe, extension);
}

}  // namespace portlang
