// portlang/basic/source_manager.hpp - Source locations and source text access
//
// This header provides the line/column location carried by tokens and
// diagnostics, and a SourceFile that maps line numbers back to text for
// snippet printing.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace portlang
{

// ============================================================================
// SourceLocation - Human-readable position
// ============================================================================

/**
 * Line and column position (1-indexed).
 *
 * Columns count Unicode code points, not bytes, so that an accented keyword
 * such as `alocação` occupies eight columns.
 */
struct SourceLocation
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(uint32_t l, uint32_t c) noexcept : line(l), column(c) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return line == other.line && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return line < other.line || (line == other.line && column < other.column);
  }
};

// ============================================================================
// SourceFile - Source text with a line table
// ============================================================================

/**
 * Owns the text of one portfolio source and pre-computes line start offsets.
 *
 * The pipeline itself only ever sees a string_view of the content; SourceFile
 * exists for the harness and the diagnostic printer.
 */
class SourceFile
{
public:
  SourceFile() = default;

  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// Display name used in ` --> name:line:col` headers
  [[nodiscard]] std::string display_name() const;

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Get the content of a specific line (0-indexed), without the line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  void set_content(std::string new_content);

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace portlang
