// tests/unit/syntax/test_lexer.cpp - SQL tokenizer tests
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "pg_sema/syntax/lexer.hpp"
#include "pg_sema/syntax/token.hpp"

using pg_sema::FileId;
using pg_sema::syntax::Lexer;
using pg_sema::syntax::Token;
using pg_sema::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src) { return Lexer(FileId::invalid(), src).lex_all(); }

std::vector<TokenKind> kinds(std::string_view src)
{
  std::vector<TokenKind> out;
  for (const auto & t : lex(src)) out.push_back(t.kind);
  return out;
}

}  // namespace

TEST(SyntaxLexer, SkipsCommentsAndWhitespace)
{
  const std::string_view src =
    "-- line comment\n"
    "SELECT /* block /* nested */ still comment */ 1;\n";

  const auto toks = lex(src);
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[0].text, "SELECT");
  EXPECT_EQ(toks[1].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[2].kind, TokenKind::Semicolon);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NumericLiterals)
{
  const auto toks = lex("42 3.14 .5 1e10 2.5E-3");
  ASSERT_EQ(toks.size(), 6U);
  EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[0].text, "42");
  EXPECT_EQ(toks[1].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(toks[2].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(toks[3].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(toks[4].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(toks[4].text, "2.5E-3");
}

TEST(SyntaxLexer, StringsAndQuotedIdentifiers)
{
  const auto toks = lex("'it''s' \"Mixed Case\" E'a\\nb'");
  ASSERT_EQ(toks.size(), 4U);

  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, "it''s");  // interior, escapes processed later

  EXPECT_EQ(toks[1].kind, TokenKind::QuotedIdentifier);
  EXPECT_EQ(toks[1].text, "Mixed Case");

  EXPECT_EQ(toks[2].kind, TokenKind::StringLiteral);
  EXPECT_TRUE(toks[2].escape);
}

TEST(SyntaxLexer, DollarQuotedBodies)
{
  const auto toks = lex("AS $$ SELECT 'x' $$ $fn$ body $$ inner $fn$");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[1].kind, TokenKind::DollarString);
  EXPECT_EQ(toks[1].text, " SELECT 'x' ");
  EXPECT_EQ(toks[2].kind, TokenKind::DollarString);
  EXPECT_EQ(toks[2].text, " body $$ inner ");
}

TEST(SyntaxLexer, PositionalParameters)
{
  const auto toks = lex("$1 + $12");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Param);
  EXPECT_EQ(toks[0].text, "1");
  EXPECT_EQ(toks[1].kind, TokenKind::Plus);
  EXPECT_EQ(toks[2].kind, TokenKind::Param);
  EXPECT_EQ(toks[2].text, "12");
}

TEST(SyntaxLexer, JsonAndComparisonOperators)
{
  const std::vector<TokenKind> expected = {
    TokenKind::Arrow,     TokenKind::ArrowText, TokenKind::HashArrow, TokenKind::HashArrowText,
    TokenKind::Concat,    TokenKind::Ne,        TokenKind::Ne,        TokenKind::Le,
    TokenKind::Ge,        TokenKind::Operator,  TokenKind::ColonColon, TokenKind::Eof,
  };
  EXPECT_EQ(kinds("-> ->> #> #>> || <> != <= >= @> ::"), expected);
}

TEST(SyntaxLexer, OperatorDoesNotSwallowTrailingMinus)
{
  const auto toks = lex("a=-1");
  ASSERT_EQ(toks.size(), 5U);
  EXPECT_EQ(toks[1].kind, TokenKind::Eq);
  EXPECT_EQ(toks[2].kind, TokenKind::Minus);
  EXPECT_EQ(toks[3].kind, TokenKind::IntLiteral);
}

TEST(SyntaxLexer, UnterminatedStringIsUnknown)
{
  const auto toks = lex("SELECT 'oops");
  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[1].kind, TokenKind::Unknown);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, RangesAreAbsoluteForSubRanges)
{
  const std::string_view src = "xx SELECT 1 yy";
  const auto toks = Lexer(FileId::invalid(), src, 3, 11).lex_all();
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].text, "SELECT");
  EXPECT_EQ(toks[0].range.get_begin().offset(), 3U);
  EXPECT_EQ(toks[1].text, "1");
  EXPECT_EQ(toks[1].range.get_begin().offset(), 10U);
}
