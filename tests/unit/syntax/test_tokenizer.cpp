#include <gtest/gtest.h>

#include <clocale>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "miniyaml/syntax/tokenizer.hpp"

using miniyaml::FileId;
using miniyaml::Severity;
using miniyaml::syntax::Token;
using miniyaml::syntax::TokenKind;
using miniyaml::syntax::tokenize;

namespace
{

std::vector<std::pair<TokenKind, std::string>> kinds_and_text(std::string_view src)
{
  std::vector<std::pair<TokenKind, std::string>> out;
  for (const Token & t : tokenize(FileId(0), src).tokens) {
    out.emplace_back(t.kind, std::string(t.slice(src).value_or("<bad span>")));
  }
  return out;
}

std::string concat(std::string_view src, const std::vector<Token> & tokens)
{
  std::string out;
  for (const Token & t : tokens) {
    const auto slice = t.slice(src);
    EXPECT_TRUE(slice.has_value());
    out += std::string(slice.value_or(""));
  }
  return out;
}

using KT = std::vector<std::pair<TokenKind, std::string>>;

}  // namespace

TEST(SyntaxTokenizer, SingleIdentifier)
{
  EXPECT_EQ(kinds_and_text("wowza"), (KT{{TokenKind::Identifier, "wowza"}}));
}

TEST(SyntaxTokenizer, KeyColonValue)
{
  EXPECT_EQ(
    kinds_and_text("hello: world"), (KT{
                                       {TokenKind::Identifier, "hello"},
                                       {TokenKind::Colon, ":"},
                                       {TokenKind::Whitespace, " "},
                                       {TokenKind::Identifier, "world"},
                                     }));
}

TEST(SyntaxTokenizer, RemovalDashIsItsOwnSymbol)
{
  EXPECT_EQ(
    kinds_and_text("-SomeProperty:"), (KT{
                                         {TokenKind::Symbol, "-"},
                                         {TokenKind::Identifier, "SomeProperty"},
                                         {TokenKind::Colon, ":"},
                                       }));
}

TEST(SyntaxTokenizer, NumericLiterals)
{
  EXPECT_EQ(kinds_and_text("123.45"), (KT{{TokenKind::FloatLiteral, "123.45"}}));
  EXPECT_EQ(kinds_and_text("-123"), (KT{{TokenKind::IntLiteral, "-123"}}));
  EXPECT_EQ(kinds_and_text("42"), (KT{{TokenKind::IntLiteral, "42"}}));
}

TEST(SyntaxTokenizer, MalformedNumbersFallBackToIdentifier)
{
  EXPECT_EQ(kinds_and_text("1.2.3"), (KT{{TokenKind::Identifier, "1.2.3"}}));
  EXPECT_EQ(kinds_and_text("99999999999999999999"), (KT{{TokenKind::Identifier, "99999999999999999999"}}));
  EXPECT_EQ(kinds_and_text("---"), (KT{{TokenKind::Identifier, "---"}}));
  EXPECT_EQ(kinds_and_text("e1.5"), (KT{{TokenKind::Identifier, "e1.5"}}));
}

TEST(SyntaxTokenizer, FloatsDoNotDependOnTheLocale)
{
  // A comma-decimal locale, when one is installed, must not change the result.
  const std::string previous = std::setlocale(LC_NUMERIC, nullptr);
  (void)std::setlocale(LC_NUMERIC, "de_DE.UTF-8");

  const auto dotted = kinds_and_text("0.75");
  const auto comma = kinds_and_text("0,75");

  (void)std::setlocale(LC_NUMERIC, previous.c_str());

  EXPECT_EQ(dotted, (KT{{TokenKind::FloatLiteral, "0.75"}}));
  EXPECT_NE(comma.front().first, TokenKind::FloatLiteral);
}

TEST(SyntaxTokenizer, BooleanKeywordsAreCaseInsensitive)
{
  EXPECT_EQ(kinds_and_text("TRUE"), (KT{{TokenKind::True, "TRUE"}}));
  EXPECT_EQ(kinds_and_text("False"), (KT{{TokenKind::False, "False"}}));
  EXPECT_EQ(kinds_and_text("yes"), (KT{{TokenKind::Yes, "yes"}}));
  EXPECT_EQ(kinds_and_text("No"), (KT{{TokenKind::No, "No"}}));
  EXPECT_EQ(kinds_and_text("Nope"), (KT{{TokenKind::Identifier, "Nope"}}));
}

TEST(SyntaxTokenizer, SingleCharacterPunctuationNeverMerges)
{
  EXPECT_EQ(
    kinds_and_text("~!@^:"), (KT{
                               {TokenKind::Tilde, "~"},
                               {TokenKind::Bang, "!"},
                               {TokenKind::At, "@"},
                               {TokenKind::Caret, "^"},
                               {TokenKind::Colon, ":"},
                             }));
}

TEST(SyntaxTokenizer, SymbolRunsAndLogicalOperators)
{
  EXPECT_EQ(
    kinds_and_text("a && b || c | d"), (KT{
                                          {TokenKind::Identifier, "a"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::LogicalAnd, "&&"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::Identifier, "b"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::LogicalOr, "||"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::Identifier, "c"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::Symbol, "|"},
                                          {TokenKind::Whitespace, " "},
                                          {TokenKind::Identifier, "d"},
                                        }));
}

TEST(SyntaxTokenizer, CommentRunsToLineEnd)
{
  EXPECT_EQ(
    kinds_and_text("A: 1 # note: here\nB:"), (KT{
                                                {TokenKind::Identifier, "A"},
                                                {TokenKind::Colon, ":"},
                                                {TokenKind::Whitespace, " "},
                                                {TokenKind::IntLiteral, "1"},
                                                {TokenKind::Whitespace, " "},
                                                {TokenKind::Comment, "# note: here"},
                                                {TokenKind::EndOfLine, "\n"},
                                                {TokenKind::Identifier, "B"},
                                                {TokenKind::Colon, ":"},
                                              }));
}

TEST(SyntaxTokenizer, CrlfIsOneEndOfLine)
{
  EXPECT_EQ(
    kinds_and_text("A:\r\nB:"), (KT{
                                   {TokenKind::Identifier, "A"},
                                   {TokenKind::Colon, ":"},
                                   {TokenKind::EndOfLine, "\r\n"},
                                   {TokenKind::Identifier, "B"},
                                   {TokenKind::Colon, ":"},
                                 }));
}

TEST(SyntaxTokenizer, BareCarriageReturnWarnsAndContinues)
{
  const std::string_view src = "A:\rB:";
  const auto result = tokenize(FileId(0), src);

  ASSERT_EQ(result.tokens.size(), 5U);
  EXPECT_EQ(result.tokens[2].kind, TokenKind::Error);
  EXPECT_EQ(result.tokens[3].kind, TokenKind::Identifier);

  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics[0].severity, Severity::Warning);
  EXPECT_EQ(result.diagnostics[0].code, "W0004");
}

TEST(SyntaxTokenizer, WhitespaceStopsAtLineTerminator)
{
  EXPECT_EQ(
    kinds_and_text("A:  \n\tB"), (KT{
                                    {TokenKind::Identifier, "A"},
                                    {TokenKind::Colon, ":"},
                                    {TokenKind::Whitespace, "  "},
                                    {TokenKind::EndOfLine, "\n"},
                                    {TokenKind::Whitespace, "\t"},
                                    {TokenKind::Identifier, "B"},
                                  }));
}

TEST(SyntaxTokenizer, NonAsciiTextBecomesSymbols)
{
  const std::string src = "Name: \xE6\x97\xA5";
  const auto result = tokenize(FileId(0), src);
  ASSERT_FALSE(result.tokens.empty());
  EXPECT_EQ(result.tokens.back().kind, TokenKind::Symbol);
  EXPECT_EQ(result.tokens.back().span.length(), 3U);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SyntaxTokenizer, TakeDiagnosticsDrainsTheBatch)
{
  miniyaml::syntax::Tokenizer tokenizer(FileId(0), "A\rB\r");
  const auto tokens = tokenizer.run();
  EXPECT_EQ(tokens.size(), 4U);
  EXPECT_EQ(tokenizer.take_diagnostics().size(), 2U);
  EXPECT_TRUE(tokenizer.take_diagnostics().empty());
}

TEST(SyntaxTokenizer, TokensCoverTheWholeInput)
{
  const std::vector<std::string> inputs = {
    "",
    "Infantry:\n\tInherits: ^Soldier\n\tHealth:\n\t\tHP: 100\n",
    "A:\r\n    B: 1.5 # c\r\n",
    "bare\rcarriage\r",
    "Key@Suffix: !value ~x && y || z\n",
    "caf\xC3\xA9: \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80\n",
    "-Remove:\n- bullet\n-123\n--\n",
    "\xC3",  // truncated sequence
    "####\n|||&&&\n",
    "\t \t\n   \n",
  };

  for (const auto & src : inputs) {
    const auto result = tokenize(FileId(0), src);
    EXPECT_EQ(concat(src, result.tokens), src);
    for (size_t i = 1; i < result.tokens.size(); ++i) {
      EXPECT_EQ(result.tokens[i - 1].span.end(), result.tokens[i].span.start());
    }
  }
}
