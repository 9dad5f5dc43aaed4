/***
 * Name: test_inference
 * Purpose: Expression inference through assignments recorded in the symbol table.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/SymbolTableBuilder.h"
#include "sema/TypeInference.h"

#include <memory>
#include <string>

using namespace pyinfer;

static sema::SymbolTable buildTable(const std::string& src) {
  lex::Lexer L; L.pushString(src, "infer.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  return builder.build(*mod);
}

// Inferred type of `x` after `x = <expr>` (with optional setup lines first).
static std::string typeOf(const std::string& expr, const std::string& setup = "") {
  const auto table = buildTable(setup + "x = " + expr + "\n");
  const auto* var = table.findVariable("x");
  if (var == nullptr || !var->inferredType) { return "<none>"; }
  return *var->inferredType;
}

TEST(Inference, Literals) {
  EXPECT_EQ(typeOf("1"), "int");
  EXPECT_EQ(typeOf("1.5"), "float");
  EXPECT_EQ(typeOf("2j"), "complex");
  EXPECT_EQ(typeOf("'s'"), "str");
  EXPECT_EQ(typeOf("f'{1}'"), "str");
  EXPECT_EQ(typeOf("b'raw'"), "bytes");
  EXPECT_EQ(typeOf("True"), "bool");
  EXPECT_EQ(typeOf("None"), "None");
}

TEST(Inference, ListsAreSampledAndUnified) {
  EXPECT_EQ(typeOf("[1, 2, 3]"), "list[int]");
  EXPECT_EQ(typeOf("[1, 2.5]"), "list[float]");
  EXPECT_EQ(typeOf("[1, 'a']"), "list");
  EXPECT_EQ(typeOf("['a', None]"), "list[str | None]");
  EXPECT_EQ(typeOf("[]"), "list");
  EXPECT_EQ(typeOf("[[1], [2]]"), "list[list[int]]");
}

TEST(Inference, SetsDictsAndTuples) {
  EXPECT_EQ(typeOf("{1, 2}"), "set[int]");
  EXPECT_EQ(typeOf("{'a': 1, 'b': 2}"), "dict[str, int]");
  EXPECT_EQ(typeOf("{'a': 1, 2: 'b'}"), "dict");
  EXPECT_EQ(typeOf("{}"), "dict");
  EXPECT_EQ(typeOf("{'a': 1, **extra}"), "dict[str, int]");
}

TEST(Inference, DictNeedsOneKeyAndOneValueType) {
  EXPECT_EQ(typeOf("{1: 'a', None: 'b'}"), "dict");
  EXPECT_EQ(typeOf("{'a': 1, 'b': None}"), "dict");
  EXPECT_EQ(typeOf("{'a': 1, 'b': 2.5}"), "dict");
  EXPECT_EQ(typeOf("{'a': [1], 'b': [2]}"), "dict[str, list[int]]");
}

TEST(Inference, Tuples) {
  EXPECT_EQ(typeOf("(1, 'a', None)"), "tuple[int, str, None]");
  EXPECT_EQ(typeOf("(1, 2, 3, 4, 5, 6, 7, 8)"), "tuple[int, int, int, int, int, int, int, int]");
  EXPECT_EQ(typeOf("(1, 2, 3, 4, 5, 6, 7, 8, 9)"), "tuple[int, ...]");
  EXPECT_EQ(typeOf("(1, 'a', 3, 4, 5, 6, 7, 8, 9)"), "tuple");
  EXPECT_EQ(typeOf("()"), "tuple");
}

TEST(Inference, ArithmeticOperators) {
  EXPECT_EQ(typeOf("7 / 2"), "float");
  EXPECT_EQ(typeOf("7 // 2"), "int");
  EXPECT_EQ(typeOf("7 // 2.0"), "float");
  EXPECT_EQ(typeOf("1 + 2.0"), "float");
  EXPECT_EQ(typeOf("'a' + 'b'"), "str");
  EXPECT_EQ(typeOf("'-' * 3"), "str");
  EXPECT_EQ(typeOf("[0] * 3"), "list[int]");
  EXPECT_EQ(typeOf("'%d' % 3"), "str");
  EXPECT_EQ(typeOf("a - b"), "int | float");
  EXPECT_EQ(typeOf("1 << 2"), "int");
  EXPECT_EQ(typeOf("{1} | {2}"), "set[int]");
}

TEST(Inference, DivisionOfUnknownOperandsIsFloat) {
  const auto table = buildTable(
      "def ratio(a, b):\n"
      "    return a / b\n"
      "def halves(a, b):\n"
      "    return a // b\n");
  EXPECT_EQ(*table.findFunction("ratio")->inferredReturn, "float");
  EXPECT_EQ(*table.findFunction("halves")->inferredReturn, "int");
}

TEST(Inference, UnaryComparisonAndBoolean) {
  EXPECT_EQ(typeOf("not y"), "bool");
  EXPECT_EQ(typeOf("-3"), "int");
  EXPECT_EQ(typeOf("~3"), "int");
  EXPECT_EQ(typeOf("1 < 2"), "bool");
  EXPECT_EQ(typeOf("a and b"), "bool");
  EXPECT_EQ(typeOf("1 if c else 2.0"), "float");
}

TEST(Inference, BuiltinCalls) {
  EXPECT_EQ(typeOf("len('abc')"), "int");
  EXPECT_EQ(typeOf("str(1)"), "str");
  EXPECT_EQ(typeOf("open('f.txt')"), "TextIOWrapper");
  EXPECT_EQ(typeOf("print('x')"), "None");
  EXPECT_EQ(typeOf("isinstance(a, int)"), "bool");
  EXPECT_EQ(typeOf("sorted([3, 1])"), "list[int]");
  EXPECT_EQ(typeOf("set(['a'])"), "set[str]");
  EXPECT_EQ(typeOf("sum([1.0, 2.0])"), "float");
  EXPECT_EQ(typeOf("sum([1, 2])"), "int");
  EXPECT_EQ(typeOf("max([1, 2])"), "int");
  EXPECT_EQ(typeOf("max(1, 2.0)"), "float");
  EXPECT_EQ(typeOf("abs(v)"), "int | float");
  EXPECT_EQ(typeOf("range(3)"), "range");
}

TEST(Inference, MethodCalls) {
  EXPECT_EQ(typeOf("'a,b'.split(',')"), "list[str]");
  EXPECT_EQ(typeOf("s.upper()"), "str");
  EXPECT_EQ(typeOf("s.startswith('a')"), "bool");
  EXPECT_EQ(typeOf("xs.append(1)"), "None");
  EXPECT_EQ(typeOf("[1].copy()"), "list[int]");
  EXPECT_EQ(typeOf("thing.frobnicate()"), "deferred(frobnicate)");
}

TEST(Inference, ModuleAttributes) {
  EXPECT_EQ(typeOf("math.pi", "import math\n"), "float");
  EXPECT_EQ(typeOf("sys.argv", "import sys\n"), "list[str]");
  EXPECT_EQ(typeOf("math.unknown", "import math\n"), "Any");
}

TEST(Inference, SubscriptsProjectElementTypes) {
  EXPECT_EQ(typeOf("nums[0]", "nums = [1, 2]\n"), "int");
  EXPECT_EQ(typeOf("nums[1:]", "nums = [1, 2]\n"), "list[int]");
  EXPECT_EQ(typeOf("pair[1]", "pair = (1, 'a')\n"), "str");
  EXPECT_EQ(typeOf("pair[-1]", "pair = (1, 'a')\n"), "str");
  EXPECT_EQ(typeOf("ages['bob']", "ages = {'bob': 3}\n"), "int");
  EXPECT_EQ(typeOf("'abc'[0]"), "str");
}

TEST(Inference, Comprehensions) {
  EXPECT_EQ(typeOf("[n * 2 for n in [1, 2]]"), "list[int]");
  EXPECT_EQ(typeOf("{w for w in 'abc'}"), "set[str]");
  EXPECT_EQ(typeOf("{k: 1 for k in ['a']}"), "dict[str, int]");
  EXPECT_EQ(typeOf("(n for n in [1])"), "generator");
  EXPECT_EQ(typeOf("[b for a, b in [(1, 'x')]]"), "list[str]");
}

TEST(Inference, NamedCallsAndClasses) {
  EXPECT_EQ(typeOf("Point()", "class Point:\n    pass\n"), "Point");
  EXPECT_EQ(typeOf("Widget()"), "Widget");
  EXPECT_EQ(typeOf("helper()"), "deferred(helper)");
  EXPECT_EQ(typeOf("make()", "def make() -> list[str]:\n    return []\n"), "list[str]");
  EXPECT_EQ(typeOf("make()", "def make():\n    return 3\n"), "int");
}

TEST(Inference, LambdasAndWalrus) {
  EXPECT_EQ(typeOf("lambda: 1"), "Callable[..., int]");
  EXPECT_EQ(typeOf("(y := 'v')"), "str");
}

TEST(Inference, NameLookupOrder) {
  // annotation wins over the heuristic and over an inferred value
  EXPECT_EQ(typeOf("total", "total: float = 0\n"), "float");
  EXPECT_EQ(typeOf("word", "word = 'w'\n"), "str");
  EXPECT_EQ(typeOf("user_count"), "int");
  EXPECT_EQ(typeOf("unknown_thing"), "Any");
}

TEST(NameHeuristic, SpellingPatterns) {
  EXPECT_EQ(sema::NameHeuristic("item_count"), "int");
  EXPECT_EQ(sema::NameHeuristic("FileName"), "str");
  EXPECT_EQ(sema::NameHeuristic("numbers"), "list[int | float]");
  EXPECT_EQ(sema::NameHeuristic("is_enabled"), "bool");
  EXPECT_EQ(sema::NameHeuristic("config"), "dict");
  EXPECT_EQ(sema::NameHeuristic("widgets"), "list");
  EXPECT_EQ(sema::NameHeuristic("x"), "Any");
}
