#include "portlang/syntax/lexer.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <string>

#include "portlang/basic/diagnostic_codes.hpp"
#include "portlang/syntax/keywords.hpp"

namespace portlang::syntax
{
namespace
{

bool is_ascii_letter(unsigned char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_ascii_digit(unsigned char c) { return c >= '0' && c <= '9'; }

// Latin-1 Supplement letters U+00C0..U+00FF are encoded as C3 80..C3 BF.
// U+00D7 (multiplication sign) and U+00F7 (division sign) are not letters.
bool is_accented_letter(unsigned char lead, unsigned char trail)
{
  return lead == 0xC3 && trail >= 0x80 && trail <= 0xBF && trail != 0x97 && trail != 0xB7;
}

}  // namespace

size_t Lexer::code_point_width() const noexcept
{
  const auto lead = static_cast<unsigned char>(peek());
  size_t width = 1;
  if (lead >= 0xF0 && lead <= 0xF7) {
    width = 4;
  } else if (lead >= 0xE0) {
    width = (lead <= 0xEF) ? 3 : 1;
  } else if (lead >= 0xC0) {
    width = 2;
  }
  // A truncated or malformed sequence counts as a single byte.
  if (width > src_.size() - pos_) {
    return 1;
  }
  for (size_t i = 1; i < width; ++i) {
    const auto trail = static_cast<unsigned char>(src_[pos_ + i]);
    if (trail < 0x80 || trail > 0xBF) {
      return 1;
    }
  }
  return width;
}

void Lexer::advance() noexcept
{
  if (eof()) {
    return;
  }
  if (peek() == '\n') {
    ++line_;
    column_ = 1;
    ++pos_;
    return;
  }
  pos_ += code_point_width();
  ++column_;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    break;
  }
}

bool Lexer::at_identifier_start() const noexcept
{
  const auto c = static_cast<unsigned char>(peek());
  if (is_ascii_letter(c) || c == '_') {
    return true;
  }
  return is_accented_letter(c, static_cast<unsigned char>(peek(1)));
}

bool Lexer::at_identifier_continue() const noexcept
{
  return at_identifier_start() || is_ascii_digit(static_cast<unsigned char>(peek()));
}

Token Lexer::lex_identifier_or_keyword()
{
  const SourceLocation start_loc = location();
  const size_t start = pos_;
  while (!eof() && at_identifier_continue()) {
    advance();
  }

  std::string text(src_.substr(start, pos_ - start));

  Token t;
  t.kind = lookup_keyword(text).value_or(TokenKind::Identifier);
  t.value = std::move(text);
  t.location = start_loc;
  return t;
}

Token Lexer::lex_number()
{
  const SourceLocation start_loc = location();
  const size_t start = pos_;
  int dot_count = 0;

  while (!eof()) {
    const char c = peek();
    if (c == '.') {
      if (++dot_count > 1) {
        diags_
          .report_error(
            DiagnosticCategory::Lexical, "number literal has more than one decimal point")
          .with_code(diag_code::k_multiple_decimal_points)
          .with_location(start_loc)
          .with_suggestion("use a single `.` as the decimal separator");
        break;
      }
      advance();
      continue;
    }
    if (!is_ascii_digit(static_cast<unsigned char>(c))) {
      break;
    }
    advance();
  }

  const std::string_view text = src_.substr(start, pos_ - start);

  Token t;
  t.kind = TokenKind::Number;
  t.location = start_loc;

  const bool is_float = dot_count > 0;
  bool ok = false;

  if (!is_float) {
    std::int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    ok = (ec == std::errc{} && ptr == text.data() + text.size());
    t.value = ok ? v : std::int64_t{0};
  } else {
    const std::string buf(text);
    char * end = nullptr;
    errno = 0;
    const double v = std::strtod(buf.c_str(), &end);
    ok = (errno != ERANGE && end == buf.c_str() + buf.size());
    t.value = ok ? v : 0.0;
  }

  if (!ok) {
    diags_.report_error(DiagnosticCategory::Lexical, fmt::format("invalid number `{}`", text))
      .with_code(diag_code::k_invalid_number)
      .with_location(start_loc);
  }
  return t;
}

Token Lexer::lex_string()
{
  const SourceLocation start_loc = location();
  // opening quote
  advance();

  const size_t payload_start = pos_;
  while (!eof()) {
    const char c = peek();
    if (c == '"') {
      break;
    }
    if (c == '\n') {
      // Leave the line break for the main loop.
      diags_
        .report_error(DiagnosticCategory::Lexical, "string literal cannot contain a line break")
        .with_code(diag_code::k_string_line_break)
        .with_location(start_loc)
        .with_suggestion("close the string on the same line");
      break;
    }
    advance();
  }
  const size_t payload_end = pos_;

  if (!eof() && peek() == '"') {
    advance();
  } else {
    diags_.report_error(DiagnosticCategory::Lexical, "unterminated string literal")
      .with_code(diag_code::k_unterminated_string)
      .with_location(start_loc)
      .with_suggestion("add a closing `\"` at the end of the string");
  }

  Token t;
  t.kind = TokenKind::String;
  t.value = std::string(src_.substr(payload_start, payload_end - payload_start));
  t.location = start_loc;
  return t;
}

Token Lexer::next_token()
{
  while (true) {
    skip_whitespace();

    if (eof()) {
      Token t;
      t.kind = TokenKind::Eof;
      t.location = location();
      return t;
    }

    if (at_identifier_start()) {
      return lex_identifier_or_keyword();
    }
    if (is_ascii_digit(static_cast<unsigned char>(peek()))) {
      return lex_number();
    }
    if (peek() == '"') {
      return lex_string();
    }

    const SourceLocation start_loc = location();
    const char ch = peek();

    TokenKind kind = TokenKind::Eof;
    switch (ch) {
      case '=':
        kind = TokenKind::Eq;
        break;
      case '{':
        kind = TokenKind::LBrace;
        break;
      case '}':
        kind = TokenKind::RBrace;
        break;
      case ';':
        kind = TokenKind::Semicolon;
        break;
      case '%':
        kind = TokenKind::Percent;
        break;
      default:
        break;
    }

    if (kind != TokenKind::Eof) {
      advance();
      Token t;
      t.kind = kind;
      t.value = std::string(1, ch);
      t.location = start_loc;
      return t;
    }

    // Unrecognized: report, skip exactly one character, keep going.
    const std::string_view bad = src_.substr(pos_, code_point_width());
    diags_.report_error(DiagnosticCategory::Lexical, fmt::format("unrecognized character `{}`", bad))
      .with_code(diag_code::k_unrecognized_character)
      .with_location(start_loc)
      .with_suggestion("remove characters that are not part of the portfolio language");
    advance();
  }
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(std::move(t));
    if (done) {
      break;
    }
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src, DiagnosticBag & diags)
{
  Lexer lexer(src, diags);
  return lexer.lex_all();
}

}  // namespace portlang::syntax
