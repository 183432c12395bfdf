#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include "portlang/basic/diagnostic_codes.hpp"
#include "portlang/syntax/keywords.hpp"
#include "portlang/syntax/lexer.hpp"
#include "portlang/syntax/token.hpp"
#include "portlang/test_support/parse_helpers.hpp"

using portlang::SourceLocation;
using portlang::syntax::Lexer;
using portlang::syntax::Token;
using portlang::syntax::TokenKind;
using portlang::test_support::lex;

namespace
{

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

// ============================================================================
// Token kinds
// ============================================================================

TEST(SyntaxLexer, PunctuationAndKeywords)
{
  auto unit = lex("carteira { nome = \"X\"; renda_fixa = 10%; }");
  EXPECT_TRUE(unit.diags.empty());

  const std::vector<TokenKind> expected = {
    TokenKind::KwCarteira, TokenKind::LBrace,    TokenKind::KwNome,    TokenKind::Eq,
    TokenKind::String,     TokenKind::Semicolon, TokenKind::KwRendaFixa, TokenKind::Eq,
    TokenKind::Number,     TokenKind::Percent,   TokenKind::Semicolon, TokenKind::RBrace,
    TokenKind::Eof,
  };
  EXPECT_EQ(kinds(unit.tokens), expected);
}

TEST(SyntaxLexer, AccentedKeywords)
{
  auto unit = lex("alocação restrições ações_nacionais ações_internacionais");
  EXPECT_TRUE(unit.diags.empty());

  const std::vector<TokenKind> expected = {
    TokenKind::KwAlocacao, TokenKind::KwRestricoes, TokenKind::KwAcoesNacionais,
    TokenKind::KwAcoesInternacionais, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(unit.tokens), expected);
  EXPECT_EQ(unit.tokens[0].text(), "alocação");
}

TEST(SyntaxLexer, EveryKeywordRoundTripsThroughTheTable)
{
  for (const auto & [spelling, kind] : portlang::syntax::k_keywords) {
    auto unit = lex(spelling);
    ASSERT_EQ(unit.tokens.size(), 2U) << spelling;
    EXPECT_EQ(unit.tokens[0].kind, kind) << spelling;
    EXPECT_EQ(portlang::syntax::to_string(kind), spelling);
  }
}

TEST(SyntaxLexer, KeywordsAreCaseSensitive)
{
  auto unit = lex("Carteira ALOCAÇÃO alocacao");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 4U);
  EXPECT_EQ(unit.tokens[0].kind, TokenKind::Identifier);
  EXPECT_EQ(unit.tokens[1].kind, TokenKind::Identifier);
  EXPECT_EQ(unit.tokens[2].kind, TokenKind::Identifier);
  EXPECT_EQ(unit.tokens[2].text(), "alocacao");
}

TEST(SyntaxLexer, UnknownIdentifiersAreStillEmitted)
{
  auto unit = lex("foo_1 _bar");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[0].kind, TokenKind::Identifier);
  EXPECT_EQ(unit.tokens[0].text(), "foo_1");
  EXPECT_EQ(unit.tokens[1].text(), "_bar");
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  auto unit = lex("  \n\t ");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 1U);
  EXPECT_EQ(unit.tokens[0].kind, TokenKind::Eof);
  EXPECT_EQ(unit.tokens[0].location, (SourceLocation{2, 3}));
}

// ============================================================================
// Positions
// ============================================================================

TEST(SyntaxLexer, PositionsAreTokenStarts)
{
  auto unit = lex("carteira {\n  nome = \"Minha\";\n}");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 8U);

  EXPECT_EQ(unit.tokens[0].location, (SourceLocation{1, 1}));   // carteira
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{1, 10}));  // {
  EXPECT_EQ(unit.tokens[2].location, (SourceLocation{2, 3}));   // nome
  EXPECT_EQ(unit.tokens[3].location, (SourceLocation{2, 8}));   // =
  EXPECT_EQ(unit.tokens[4].location, (SourceLocation{2, 10}));  // "Minha"
  EXPECT_EQ(unit.tokens[5].location, (SourceLocation{2, 17}));  // ;
  EXPECT_EQ(unit.tokens[6].location, (SourceLocation{3, 1}));   // }
}

TEST(SyntaxLexer, ColumnsCountCodePoints)
{
  auto unit = lex("alocação {");
  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[1].kind, TokenKind::LBrace);
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{1, 10}));
}

TEST(SyntaxLexer, CarriageReturnIsWhitespace)
{
  auto unit = lex("carteira\r\n{");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{2, 1}));
}

// ============================================================================
// Numbers
// ============================================================================

TEST(SyntaxLexer, IntegerAndFloatingValues)
{
  auto unit = lex("42 1.5 0 7.");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 5U);

  EXPECT_TRUE(unit.tokens[0].is_integer());
  EXPECT_EQ(std::get<std::int64_t>(unit.tokens[0].value), 42);

  EXPECT_FALSE(unit.tokens[1].is_integer());
  EXPECT_DOUBLE_EQ(unit.tokens[1].number(), 1.5);

  EXPECT_TRUE(unit.tokens[2].is_integer());
  EXPECT_DOUBLE_EQ(unit.tokens[2].number(), 0.0);

  EXPECT_FALSE(unit.tokens[3].is_integer());
  EXPECT_DOUBLE_EQ(unit.tokens[3].number(), 7.0);
}

TEST(SyntaxLexer, SecondDecimalPointStopsTheNumber)
{
  auto unit = lex("1.2.3");

  ASSERT_EQ(unit.diags.errors().size(), 2U);
  const auto & first = unit.diags.errors()[0];
  EXPECT_EQ(first.code, portlang::diag_code::k_multiple_decimal_points);
  EXPECT_EQ(first.category, portlang::DiagnosticCategory::Lexical);
  EXPECT_EQ(first.location, (SourceLocation{1, 1}));
  // The leftover `.` is not part of any token.
  EXPECT_EQ(unit.diags.errors()[1].code, portlang::diag_code::k_unrecognized_character);
  EXPECT_EQ(unit.diags.errors()[1].location, (SourceLocation{1, 4}));

  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[0].kind, TokenKind::Number);
  EXPECT_DOUBLE_EQ(unit.tokens[0].number(), 1.2);
  EXPECT_EQ(unit.tokens[1].kind, TokenKind::Number);
  EXPECT_DOUBLE_EQ(unit.tokens[1].number(), 3.0);
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{1, 5}));
}

TEST(SyntaxLexer, IntegerOverflowYieldsZero)
{
  auto unit = lex("99999999999999999999999");

  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.errors()[0].code, portlang::diag_code::k_invalid_number);
  ASSERT_EQ(unit.tokens.size(), 2U);
  EXPECT_EQ(unit.tokens[0].kind, TokenKind::Number);
  EXPECT_DOUBLE_EQ(unit.tokens[0].number(), 0.0);
}

// ============================================================================
// Strings
// ============================================================================

TEST(SyntaxLexer, StringValueExcludesQuotes)
{
  auto unit = lex("\"Carteira Aposentadoria\" \"\"");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[0].text(), "Carteira Aposentadoria");
  EXPECT_EQ(unit.tokens[1].kind, TokenKind::String);
  EXPECT_EQ(unit.tokens[1].text(), "");
}

TEST(SyntaxLexer, LineBreakInStringRaisesBothDiagnostics)
{
  auto unit = lex("nome = \"abc\ndef");

  ASSERT_EQ(unit.diags.errors().size(), 2U);
  EXPECT_EQ(unit.diags.errors()[0].code, portlang::diag_code::k_string_line_break);
  EXPECT_EQ(unit.diags.errors()[0].location, (SourceLocation{1, 8}));
  EXPECT_EQ(unit.diags.errors()[1].code, portlang::diag_code::k_unterminated_string);
  EXPECT_EQ(unit.diags.errors()[1].location, (SourceLocation{1, 8}));

  ASSERT_EQ(unit.tokens.size(), 5U);
  EXPECT_EQ(unit.tokens[2].kind, TokenKind::String);
  EXPECT_EQ(unit.tokens[2].text(), "abc");
  EXPECT_EQ(unit.tokens[3].kind, TokenKind::Identifier);
  EXPECT_EQ(unit.tokens[3].text(), "def");
  EXPECT_EQ(unit.tokens[3].location, (SourceLocation{2, 1}));
}

TEST(SyntaxLexer, UnterminatedStringAtEndOfInput)
{
  auto unit = lex("\"abc");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.errors()[0].code, portlang::diag_code::k_unterminated_string);
  ASSERT_EQ(unit.tokens.size(), 2U);
  EXPECT_EQ(unit.tokens[0].text(), "abc");
}

// ============================================================================
// Unrecognized characters
// ============================================================================

TEST(SyntaxLexer, UnrecognizedCharacterIsSkipped)
{
  auto unit = lex("carteira # {");

  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.errors()[0];
  EXPECT_EQ(d.code, portlang::diag_code::k_unrecognized_character);
  EXPECT_EQ(d.category, portlang::DiagnosticCategory::Lexical);
  EXPECT_EQ(d.location, (SourceLocation{1, 10}));
  EXPECT_NE(d.message.find('#'), std::string::npos);

  const std::vector<TokenKind> expected = {
    TokenKind::KwCarteira, TokenKind::LBrace, TokenKind::Eof};
  EXPECT_EQ(kinds(unit.tokens), expected);
}

TEST(SyntaxLexer, EachBadCharacterIsReported)
{
  auto unit = lex("@@-");
  EXPECT_EQ(unit.diags.count(portlang::diag_code::k_unrecognized_character), 3U);
  ASSERT_EQ(unit.tokens.size(), 1U);
}

TEST(SyntaxLexer, MultiplicationSignIsNotALetter)
{
  auto unit = lex("a×b");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.errors()[0].message, "unrecognized character `×`");
  ASSERT_EQ(unit.tokens.size(), 3U);
  EXPECT_EQ(unit.tokens[0].text(), "a");
  EXPECT_EQ(unit.tokens[1].text(), "b");
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{1, 3}));
}

TEST(SyntaxLexer, MalformedUtf8LeadByteSkipsOnlyItself)
{
  auto unit = lex("carteira \xC3{ aloca\xC3\xA7\xC3\xA3o { renda_fixa = 100\xE2%; } }");

  EXPECT_EQ(unit.diags.count(portlang::diag_code::k_unrecognized_character), 2U);
  EXPECT_EQ(unit.diags.size(), 2U);

  const std::vector<TokenKind> expected = {
    TokenKind::KwCarteira, TokenKind::LBrace,    TokenKind::KwAlocacao, TokenKind::LBrace,
    TokenKind::KwRendaFixa, TokenKind::Eq,       TokenKind::Number,     TokenKind::Percent,
    TokenKind::Semicolon,  TokenKind::RBrace,    TokenKind::RBrace,     TokenKind::Eof};
  EXPECT_EQ(kinds(unit.tokens), expected);
  EXPECT_EQ(unit.tokens[1].location, (SourceLocation{1, 11}));
}

TEST(SyntaxLexer, TruncatedSequenceAtEndOfInput)
{
  auto unit = lex(";\xE2\x82");

  EXPECT_EQ(unit.diags.count(portlang::diag_code::k_unrecognized_character), 2U);
  const std::vector<TokenKind> expected = {TokenKind::Semicolon, TokenKind::Eof};
  EXPECT_EQ(kinds(unit.tokens), expected);
}

TEST(SyntaxLexer, LexerClassAndFreeFunctionAgree)
{
  constexpr std::string_view src = "carteira { alocação { renda_fixa = 100%; } }";

  portlang::DiagnosticBag a;
  Lexer lexer(src, a);
  const auto from_class = lexer.lex_all();

  portlang::DiagnosticBag b;
  const auto from_function = portlang::syntax::tokenize(src, b);

  EXPECT_EQ(from_class, from_function);
  EXPECT_TRUE(a.empty());
  EXPECT_TRUE(b.empty());
}
