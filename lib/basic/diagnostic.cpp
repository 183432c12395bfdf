// portlang/basic/diagnostic.cpp - Diagnostic implementation
#include "portlang/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace portlang
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "";
}

std::string_view to_string(DiagnosticCategory category) noexcept
{
  switch (category) {
    case DiagnosticCategory::Lexical:
      return "lexical";
    case DiagnosticCategory::Syntactic:
      return "syntactic";
    case DiagnosticCategory::Semantic:
      return "semantic";
    case DiagnosticCategory::Validation:
      return "validation";
    case DiagnosticCategory::Generation:
      return "generation";
  }
  return "";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string_view code)
{
  diagnostic_.code = std::string(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_location(SourceLocation location)
{
  if (location.is_valid()) {
    diagnostic_.location = location;
  }
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_suggestion(std::string suggestion)
{
  diagnostic_.suggestion = std::move(suggestion);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, DiagnosticCategory category, std::string message)
{
  Diagnostic d;
  d.category = category;
  d.severity = severity;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(DiagnosticCategory category, std::string message)
{
  return report(Severity::Error, category, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(DiagnosticCategory category, std::string message)
{
  return report(Severity::Warning, category, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_info(DiagnosticCategory category, std::string message)
{
  return report(Severity::Info, category, std::move(message));
}

std::vector<Diagnostic> & DiagnosticBag::bucket_for(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return errors_;
    case Severity::Warning:
      return warnings_;
    case Severity::Info:
      break;
  }
  return infos_;
}

void DiagnosticBag::add(Diagnostic && diag)
{
  auto & bucket = bucket_for(diag.severity);
  bucket.push_back(std::move(diag));
}

void DiagnosticBag::add(const Diagnostic & diag) { bucket_for(diag.severity).push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::all() const
{
  std::vector<Diagnostic> result;
  result.reserve(size());
  result.insert(result.end(), errors_.begin(), errors_.end());
  result.insert(result.end(), warnings_.begin(), warnings_.end());
  result.insert(result.end(), infos_.begin(), infos_.end());
  return result;
}

const Diagnostic * DiagnosticBag::find(std::string_view code) const noexcept
{
  for (const auto * bucket : {&errors_, &warnings_, &infos_}) {
    const auto it = std::find_if(
      bucket->begin(), bucket->end(), [&](const Diagnostic & d) { return d.code == code; });
    if (it != bucket->end()) {
      return &*it;
    }
  }
  return nullptr;
}

size_t DiagnosticBag::count(std::string_view code) const noexcept
{
  size_t n = 0;
  for (const auto * bucket : {&errors_, &warnings_, &infos_}) {
    n += static_cast<size_t>(std::count_if(
      bucket->begin(), bucket->end(), [&](const Diagnostic & d) { return d.code == code; }));
  }
  return n;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  for (auto & d : other.errors_) {
    errors_.push_back(std::move(d));
  }
  for (auto & d : other.warnings_) {
    warnings_.push_back(std::move(d));
  }
  for (auto & d : other.infos_) {
    infos_.push_back(std::move(d));
  }
  other.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
  warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
  infos_.insert(infos_.end(), other.infos_.begin(), other.infos_.end());
}

void DiagnosticBag::clear() noexcept
{
  errors_.clear();
  warnings_.clear();
  infos_.clear();
}

}  // namespace portlang
