// portlang/codegen/report_generator.hpp - Portfolio report renderers
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "portlang/ast/document.hpp"

namespace portlang
{

enum class ReportFormat : uint8_t {
  Text,
  Json,
  Xml,
};

[[nodiscard]] std::string_view to_string(ReportFormat format) noexcept;
[[nodiscard]] std::optional<ReportFormat> parse_report_format(std::string_view text) noexcept;

/**
 * Turns a validated document into a formatted artifact.
 *
 * Renderers are read-only consumers of the document. They may throw
 * std::exception on failure; the compiler driver converts that into GEN003.
 */
class ReportRenderer
{
public:
  virtual ~ReportRenderer() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

  virtual void render(const PortfolioDocument & document, std::ostream & out) const = 0;
};

/**
 * Plain-text report: general information, allocation table, analysis
 * metrics, visual distribution, restrictions, rebalancing and
 * recommendations.
 */
class TextReportRenderer final : public ReportRenderer
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "text"; }
  [[nodiscard]] std::string_view file_extension() const noexcept override { return "txt"; }

  void render(const PortfolioDocument & document, std::ostream & out) const override;
};

/**
 * JSON report (nlohmann::json): the serialized document plus an "analysis"
 * object.
 */
class JsonReportRenderer final : public ReportRenderer
{
public:
  explicit JsonReportRenderer(int indent = 2) : indent_(indent) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "json"; }
  [[nodiscard]] std::string_view file_extension() const noexcept override { return "json"; }

  void render(const PortfolioDocument & document, std::ostream & out) const override;

private:
  int indent_;
};

/**
 * XML report (tinyxml2) with the same content as the JSON report.
 */
class XmlReportRenderer final : public ReportRenderer
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "xml"; }
  [[nodiscard]] std::string_view file_extension() const noexcept override { return "xml"; }

  void render(const PortfolioDocument & document, std::ostream & out) const override;
};

[[nodiscard]] std::unique_ptr<ReportRenderer> make_report_renderer(ReportFormat format);

/**
 * File name derived from the portfolio name: alphanumerics, space, '-' and
 * '_' are kept, the result is trimmed, spaces become '_' and ASCII letters
 * are lowercased. "carteira" is used when the name is absent or sanitises to
 * nothing. The result is `<name>_report.<extension>`.
 */
[[nodiscard]] std::string default_report_file_name(
  const PortfolioDocument & document, std::string_view extension);

}  // namespace portlang
