/***
 * Name: test_undeclared
 * Purpose: Loads of names bound nowhere are reported once with their position.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/SymbolTableBuilder.h"
#include "sema/UndeclaredDetector.h"

#include <string>
#include <vector>

using namespace pyinfer;

static std::vector<sema::UndeclaredReference> detect(const char* src, sema::UndeclaredOptions opts = {}) {
  lex::Lexer L; L.pushString(src, "und.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  const auto table = builder.build(*mod);
  sema::UndeclaredDetector detector(table, opts);
  return detector.detect(*mod);
}

TEST(Undeclared, ReportsFreeNameInsideFunction) {
  const auto refs = detect("def f(x): return x + y\n");
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].name, "y");
  EXPECT_EQ(refs[0].line, 1);
  EXPECT_EQ(refs[0].col, 21);
  EXPECT_EQ(refs[0].context, "load");
  ASSERT_TRUE(refs[0].function.has_value());
  EXPECT_EQ(*refs[0].function, "f");
}

TEST(Undeclared, ModuleLevelReferenceHasNoFunction) {
  const auto refs = detect("print(missing)\n");
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].name, "missing");
  EXPECT_FALSE(refs[0].function.has_value());
}

TEST(Undeclared, BuiltinsAndDeclaredNamesAreSilent) {
  const auto refs = detect(R"PY(
import os
from typing import List
CONST = 1
class Box:
    pass
def use(a):
    for i in range(len(a)):
        print(i, CONST, Box, os, List, __name__, ValueError, True)
    return [v for v in a if isinstance(v, int)]
)PY");
  EXPECT_TRUE(refs.empty());
}

TEST(Undeclared, LaterDefinitionsCount) {
  const auto refs = detect(R"PY(
def first():
    return second()
def second():
    return 1
)PY");
  EXPECT_TRUE(refs.empty());
}

TEST(Undeclared, StoresAreNeverReported) {
  const auto refs = detect("a = 1\n(b := 2)\ndel a\n");
  EXPECT_TRUE(refs.empty());
}

TEST(Undeclared, RepeatedUseAtDifferentPositionsIsReportedEach) {
  const auto refs = detect("x1 = ghost\nx2 = ghost\n");
  ASSERT_EQ(refs.size(), 2u);
  EXPECT_EQ(refs[0].line, 1);
  EXPECT_EQ(refs[1].line, 2);
}

TEST(Undeclared, NestedFunctionSeesOnlyItsOwnParameters) {
  const char* src = R"PY(
def outer(seed):
    def inner():
        return seed
    return inner
)PY";
  const auto refs = detect(src);
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].name, "seed");
  EXPECT_EQ(*refs[0].function, "inner");

  sema::UndeclaredOptions chained;
  chained.enclosingParameters = true;
  EXPECT_TRUE(detect(src, chained).empty());
}

TEST(Undeclared, BuiltinNameSetCoversCommonNames) {
  const auto& names = sema::BuiltinNames();
  for (const char* n : {"print", "len", "dict", "Exception", "KeyError", "DeprecationWarning", "None",
                        "NotImplemented", "__file__", "__import__"}) {
    EXPECT_EQ(names.count(n), 1u) << n;
  }
  EXPECT_EQ(names.count("numpy"), 0u);
}
