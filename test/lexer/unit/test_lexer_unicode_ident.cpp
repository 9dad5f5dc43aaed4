/***
 * Name: test_lexer_unicode_ident
 * Purpose: Unicode identifiers follow XID rules and are NFKC-normalized.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "pyinfer/exceptions/parse_error.h"

using namespace pyinfer;

TEST(LexerUnicodeIdent, XIDStartContinue) {
  lex::Lexer L; L.pushString("def π():\n    return 0\n", "uid.py");
  auto toks = L.tokens();
  bool sawPi = false;
  for (const auto& t : toks) { if (t.kind == lex::TokenKind::Ident && t.text == "π") { sawPi = true; break; } }
  EXPECT_TRUE(sawPi);
}

TEST(LexerUnicodeIdent, NfkcNormalization) {
  // U+FB01 LATIN SMALL LIGATURE FI normalizes to "fi"
  lex::Lexer L; L.pushString("\xEF\xAC\x81le = 1\n", "nfkc.py");
  auto toks = L.tokens();
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "file");
}

TEST(LexerUnicodeIdent, SymbolIsRejected) {
  lex::Lexer L; L.pushString("x = \xE2\x82\xAC\n", "euro.py");
  EXPECT_THROW((void)L.tokens(), exceptions::ParseError);
}
