// portlang/basic/diagnostic.hpp - Diagnostic types shared by every pipeline stage
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "portlang/basic/source_manager.hpp"

namespace portlang
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * Only Error is blocking; Warning and Info never fail a compile.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

/**
 * Pipeline stage (or concern) that produced a diagnostic.
 */
enum class DiagnosticCategory : uint8_t {
  Lexical,
  Syntactic,
  Semantic,
  Validation,
  Generation,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(DiagnosticCategory category) noexcept;

struct Diagnostic
{
  DiagnosticCategory category = DiagnosticCategory::Semantic;
  Severity severity = Severity::Error;
  std::string code;     // e.g., "SYN001"
  std::string message;  // human-readable text

  std::optional<SourceLocation> location;
  std::optional<std::string> suggestion;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  [[nodiscard]] bool operator==(const Diagnostic & other) const
  {
    return category == other.category && severity == other.severity && code == other.code &&
           message == other.message && location == other.location &&
           suggestion == other.suggestion;
  }
  [[nodiscard]] bool operator!=(const Diagnostic & other) const { return !(*this == other); }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the
 * bag when the builder is destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_location(SourceLocation location);

  DiagnosticBuilder & with_suggestion(std::string suggestion);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Instance-scoped collector shared by reference across the lexer, parser and
 * validator of one compile.
 *
 * Diagnostics are routed into one bucket per severity. Each bucket keeps
 * insertion order; all() enumerates errors, then warnings, then infos.
 */
class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report(Severity severity, DiagnosticCategory category, std::string message);
  DiagnosticBuilder report_error(DiagnosticCategory category, std::string message);
  DiagnosticBuilder report_warning(DiagnosticCategory category, std::string message);
  DiagnosticBuilder report_info(DiagnosticCategory category, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & errors() const noexcept { return errors_; }
  [[nodiscard]] const std::vector<Diagnostic> & warnings() const noexcept { return warnings_; }
  [[nodiscard]] const std::vector<Diagnostic> & infos() const noexcept { return infos_; }
  [[nodiscard]] std::vector<Diagnostic> all() const;

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }
  [[nodiscard]] size_t size() const noexcept
  {
    return errors_.size() + warnings_.size() + infos_.size();
  }
  [[nodiscard]] size_t error_count() const noexcept { return errors_.size(); }

  /// Blocking predicate: true when the Error bucket is non-empty.
  [[nodiscard]] bool has_errors() const noexcept { return !errors_.empty(); }
  [[nodiscard]] bool has_warnings() const noexcept { return !warnings_.empty(); }

  /// Find the first diagnostic with the given code (errors, warnings, infos order).
  [[nodiscard]] const Diagnostic * find(std::string_view code) const noexcept;
  [[nodiscard]] size_t count(std::string_view code) const noexcept;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);
  void clear() noexcept;

private:
  [[nodiscard]] std::vector<Diagnostic> & bucket_for(Severity severity) noexcept;

  std::vector<Diagnostic> errors_;
  std::vector<Diagnostic> warnings_;
  std::vector<Diagnostic> infos_;
};

}  // namespace portlang
