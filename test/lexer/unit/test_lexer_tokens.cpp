/***
 * Name: test_lexer_tokens
 * Purpose: Operators, keywords, numbers, strings and positions of the token stream.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"

#include <string>
#include <vector>

using namespace pyinfer;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "tok.py");
  return L.tokens();
}

static bool hasKind(const std::vector<lex::Token>& toks, lex::TokenKind kind) {
  for (const auto& t : toks) { if (t.kind == kind) return true; }
  return false;
}

TEST(LexerTokens, MajorOperatorsPresent) {
  const char* src =
      "def f() -> int:\n"
      "    a = 1 + 2 - 3 * 4 / 5 // 2 % 7 ** 2\n"
      "    b = a << 1 >> 2 & 3 | 4 ^ 5\n"
      "    c = a == b != 0 < 1 <= 2 > 3 >= 4\n"
      "    if (n := 10) > 5: pass\n"
      "    return ...\n";
  auto toks = lexAll(src);
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::Arrow));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::StarStar));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::SlashSlash));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::LShift));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::RShift));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::NotEq));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::ColonEqual));
  EXPECT_TRUE(hasKind(toks, lex::TokenKind::Ellipsis));
}

TEST(LexerTokens, PositionsAreOneBased) {
  auto toks = lexAll("x = 1\n  \ny = 2\n");
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[2].col, 5);
  // Blank line produces no logical line
  bool sawY = false;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Ident && t.text == "y") {
      sawY = true;
      EXPECT_EQ(t.line, 3);
    }
  }
  EXPECT_TRUE(sawY);
}

TEST(LexerTokens, NumberForms) {
  auto toks = lexAll("a = 0x_ff + 0b1010 + 0o17 + 1_000 + 3.5e-2 + .5 + 2j\n");
  int ints = 0, floats = 0, imags = 0;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Int) ++ints;
    if (t.kind == lex::TokenKind::Float) ++floats;
    if (t.kind == lex::TokenKind::Imag) ++imags;
  }
  EXPECT_EQ(ints, 4);
  EXPECT_EQ(floats, 2);
  EXPECT_EQ(imags, 1);
}

TEST(LexerTokens, StringPrefixesAndTripleQuotes) {
  auto toks = lexAll(
      "a = rb'x' + br\"y\"\n"
      "b = f'{a}' + rf\"{a}\"\n"
      "c = '''one\n"
      "two'''\n"
      "d = u'text'\n");
  int bytes = 0, fstrings = 0, strings = 0;
  for (const auto& t : toks) {
    if (t.kind == lex::TokenKind::Bytes) ++bytes;
    if (t.kind == lex::TokenKind::FString) ++fstrings;
    if (t.kind == lex::TokenKind::String) ++strings;
  }
  EXPECT_EQ(bytes, 2);
  EXPECT_EQ(fstrings, 2);
  EXPECT_EQ(strings, 2);
}

TEST(LexerTokens, ImplicitAndExplicitLineJoining) {
  auto toks = lexAll(
      "x = (1 +\n"
      "     2)\n"
      "y = 1 + \\\n"
      "    2\n");
  int newlines = 0;
  for (const auto& t : toks) { if (t.kind == lex::TokenKind::Newline) ++newlines; }
  EXPECT_EQ(newlines, 2);
  EXPECT_FALSE(hasKind(toks, lex::TokenKind::Indent));
}

TEST(LexerTokens, SoftKeywordsAreIdentifiers) {
  auto toks = lexAll("match = 1\ntype = 2\ncase = 3\n");
  int idents = 0;
  for (const auto& t : toks) { if (t.kind == lex::TokenKind::Ident) ++idents; }
  EXPECT_EQ(idents, 3);
}

TEST(LexerTokens, TokenLogRendersKindAndPosition) {
  lex::Lexer L; L.pushString("x = 1\n", "log.py");
  const auto log = L.renderTokenLog();
  EXPECT_NE(log.find("1:1 Ident x"), std::string::npos);
  EXPECT_NE(log.find("1:5 Int 1"), std::string::npos);
}
