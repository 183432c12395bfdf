#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "portlang/basic/diagnostic.hpp"
#include "portlang/syntax/token.hpp"

namespace portlang::syntax
{

/**
 * Converts portfolio source text into an EOF-terminated token sequence.
 *
 * Lexical problems are reported into the shared DiagnosticBag; the lexer
 * never stops early, so lex_all() always ends with exactly one Eof token.
 */
class Lexer
{
public:
  Lexer(std::string_view src, DiagnosticBag & diags) : src_(src), diags_(diags) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] SourceLocation location() const noexcept { return {line_, column_}; }

  // Width in bytes of the code point starting at pos_ (at least 1).
  [[nodiscard]] size_t code_point_width() const noexcept;

  // Consumes one code point and updates line/column.
  void advance() noexcept;

  void skip_whitespace();

  [[nodiscard]] bool at_identifier_start() const noexcept;
  [[nodiscard]] bool at_identifier_continue() const noexcept;

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();

  std::string_view src_;
  DiagnosticBag & diags_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
};

/// Convenience wrapper: lex `src` in one call.
[[nodiscard]] std::vector<Token> tokenize(std::string_view src, DiagnosticBag & diags);

}  // namespace portlang::syntax
