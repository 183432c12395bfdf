#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"
#include "portlang/syntax/token.hpp"

namespace portlang::syntax
{

/**
 * Internal parser fault (broken cursor invariant, malformed token stream).
 *
 * Never caused by user input; Parser::parse() converts it into a single
 * SYN999 diagnostic and yields no document.
 */
class ParseFault : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Recursive-descent parser for the portfolio grammar.
 *
 * Every rule is optimistic: a failed expect() reports SYN001 without
 * consuming the offending token, the field is skipped, and the enclosing
 * section loop re-examines the current token against the keywords it knows.
 */
class Parser
{
public:
  Parser(std::vector<Token> tokens, DiagnosticBag & diags)
  : diags_(diags), tokens_(std::move(tokens))
  {
  }

  /// Parse the whole token stream. Returns std::nullopt when a structurally
  /// required element is missing or an internal fault occurred.
  [[nodiscard]] std::optional<PortfolioDocument> parse();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();

  // On mismatch: report SYN001 at the current token and return std::nullopt
  // without consuming anything.
  std::optional<TokenValue> expect(TokenKind k);
  std::optional<std::string> expect_string();
  std::optional<double> expect_number();

  void error_expected(std::string_view expected, std::string_view suggestion);
  void check_token_stream() const;

  // Grammar
  [[nodiscard]] std::optional<PortfolioDocument> parse_portfolio();
  [[nodiscard]] Configuration parse_configuration();
  void parse_horizon(Configuration & config);
  [[nodiscard]] std::optional<Allocation> parse_allocation();
  [[nodiscard]] Restrictions parse_restrictions();
  [[nodiscard]] RebalancePolicy parse_rebalance();
  [[nodiscard]] std::optional<double> parse_percentage();

  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace portlang::syntax
