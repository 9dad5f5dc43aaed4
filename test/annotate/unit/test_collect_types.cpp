/***
 * Name: test_collect_types
 * Purpose: Per-symbol type selection priorities, receivers and suggestions.
 */
#include <gtest/gtest.h>
#include "annotate/Annotator.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/ResolveDeferred.h"
#include "sema/SymbolTableBuilder.h"

#include <string>

using namespace pyinfer;

static sema::SymbolTable buildTable(const char* src) {
  lex::Lexer L; L.pushString(src, "collect.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  auto table = builder.build(*mod);
  sema::ResolveDeferred(table);
  return table;
}

TEST(CollectTypes, ParameterPriority) {
  const auto table = buildTable(R"PY(
def f(a: bytes, b=2.5, filename=None, zz=None, q=None, items=None, count=3):
    return None
)PY");
  annotate::Suggestions hints;
  hints.functionSuggestions["f"].params["zz"] = "set[int]";
  hints.functionSuggestions["f"].params["items"] = "list[str]";
  hints.functionSuggestions["f"].params["count"] = "str";
  const auto info = annotate::CollectTypes(table, &hints);
  const auto& fn = info.functions.at("f");
  ASSERT_EQ(fn.params.size(), 7u);
  EXPECT_EQ(*fn.paramType("a"), "bytes");
  EXPECT_EQ(*fn.paramType("b"), "float");
  EXPECT_EQ(*fn.paramType("filename"), "str");
  EXPECT_EQ(*fn.paramType("zz"), "set[int]");
  EXPECT_EQ(*fn.paramType("q"), "Any");
  // A suggestion beats the name heuristic but not a default value
  EXPECT_EQ(*fn.paramType("items"), "list[str]");
  EXPECT_EQ(*fn.paramType("count"), "int");
  EXPECT_EQ(fn.paramType("missing"), nullptr);
}

TEST(CollectTypes, ReturnPriority) {
  const auto table = buildTable(R"PY(
def annotated() -> NoneType:
    return 1
def inferred():
    return [1, 2]
def suggested(z):
    return z
def silent():
    print("x")
def opaque(z):
    return z
)PY");
  annotate::Suggestions hints;
  hints.functionSuggestions["suggested"].returnType = "int";
  const auto info = annotate::CollectTypes(table, &hints);
  EXPECT_EQ(info.functions.at("annotated").returnType, "None");
  EXPECT_EQ(info.functions.at("inferred").returnType, "list[int]");
  EXPECT_EQ(info.functions.at("suggested").returnType, "int");
  EXPECT_EQ(info.functions.at("silent").returnType, "None");
  EXPECT_EQ(info.functions.at("opaque").returnType, "Any");
}

TEST(CollectTypes, MethodReceiverIsSkipped) {
  const auto table = buildTable(R"PY(
class Shape:
    def area(self, scale=1.0):
        return scale
    @staticmethod
    def unit(size=1):
        return size
)PY");
  const auto info = annotate::CollectTypes(table);
  const auto& area = info.functions.at("area");
  ASSERT_EQ(area.params.size(), 1u);
  EXPECT_EQ(area.params[0].first, "scale");
  EXPECT_EQ(area.returnType, "float");
  ASSERT_EQ(info.functions.at("unit").params.size(), 1u);
  EXPECT_EQ(info.functions.at("unit").params[0].first, "size");
}

TEST(CollectTypes, VariableSources) {
  const auto table = buildTable(R"PY(
limit: int = 3
label = "x"
mystery = obj.frob()
other = obj.frob()
)PY");
  annotate::Suggestions hints;
  hints.inferences["mystery"] = "bytes";
  const auto info = annotate::CollectTypes(table, &hints);
  EXPECT_EQ(info.variables.at("limit").source, annotate::TypeSource::Annotation);
  EXPECT_EQ(info.variables.at("label").type, "str");
  EXPECT_EQ(info.variables.at("label").source, annotate::TypeSource::Inferred);
  EXPECT_EQ(info.variables.at("mystery").type, "bytes");
  EXPECT_EQ(info.variables.at("mystery").source, annotate::TypeSource::Suggestion);
  EXPECT_EQ(info.variables.at("other").type, "Any");
  EXPECT_EQ(info.variables.at("other").source, annotate::TypeSource::Fallback);
  EXPECT_EQ(info.variables.at("label").line, 3);
  EXPECT_EQ(info.annotationCount(), 4u);
  EXPECT_STREQ(annotate::to_string(annotate::TypeSource::Suggestion), "suggestion");
}

TEST(CollectTypes, ResolvedPlaceholdersAreUsed) {
  const auto table = buildTable(R"PY(
def get():
    return build()
def build():
    return Thing()
)PY");
  const auto info = annotate::CollectTypes(table);
  EXPECT_EQ(info.functions.at("get").returnType, "Thing");
}
