/***
 * Name: test_resolve_deferred
 * Purpose: Placeholders for calls to later definitions are rewritten in one pass.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/ResolveDeferred.h"
#include "sema/SymbolTableBuilder.h"

using namespace pyinfer;

static sema::SymbolTable buildTable(const char* src) {
  lex::Lexer L; L.pushString(src, "defer.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  return builder.build(*mod);
}

TEST(ResolveDeferred, ForwardCallToClassFactory) {
  auto table = buildTable(R"PY(
def greet():
    return make_greeter()

def make_greeter():
    return Greeter()

class Greeter:
    pass
)PY");
  EXPECT_EQ(*table.findFunction("greet")->inferredReturn, "deferred(make_greeter)");
  EXPECT_EQ(sema::ResolveDeferred(table), 1u);
  EXPECT_EQ(*table.findFunction("greet")->inferredReturn, "Greeter");
  EXPECT_EQ(*table.findFunction("make_greeter")->inferredReturn, "Greeter");
}

TEST(ResolveDeferred, AnnotatedTargetWins) {
  auto table = buildTable(R"PY(
owner = find_owner()
def find_owner() -> Person:
    return lookup()
)PY");
  EXPECT_EQ(*table.findVariable("owner")->inferredType, "deferred(find_owner)");
  sema::ResolveDeferred(table);
  EXPECT_EQ(*table.findVariable("owner")->inferredType, "Person");
}

TEST(ResolveDeferred, UnionMembersAreResolvedIndividually) {
  auto table = buildTable(R"PY(
def pick(flag):
    if flag:
        return build_car()
    return None

def build_car():
    return Car()
)PY");
  EXPECT_EQ(*table.findFunction("pick")->inferredReturn, "deferred(build_car) | None");
  sema::ResolveDeferred(table);
  EXPECT_EQ(*table.findFunction("pick")->inferredReturn, "Car | None");
}

TEST(ResolveDeferred, UnknownTargetsStayDeferred) {
  auto table = buildTable(R"PY(
def run():
    return external_helper()
value = obj.mystery()
)PY");
  EXPECT_EQ(sema::ResolveDeferred(table), 0u);
  EXPECT_EQ(*table.findFunction("run")->inferredReturn, "deferred(external_helper)");
  EXPECT_EQ(*table.findVariable("value")->inferredType, "deferred(mystery)");
}

TEST(ResolveDeferred, ChainedPlaceholdersAreNotFollowed) {
  auto table = buildTable(R"PY(
def a():
    return b()
def b():
    return c()
def c():
    return 1
)PY");
  // b still carries a placeholder when a is visited, so a stays deferred
  sema::ResolveDeferred(table);
  EXPECT_EQ(*table.findFunction("b")->inferredReturn, "int");
  EXPECT_EQ(*table.findFunction("a")->inferredReturn, "deferred(b)");
}

TEST(ResolveDeferred, ContainerParametersAreResolved) {
  auto table = buildTable(R"PY(
xs = [make()]
pairs = {'w': make()}
def make():
    return Widget()
)PY");
  EXPECT_EQ(*table.findVariable("xs")->inferredType, "list[deferred(make)]");
  EXPECT_EQ(sema::ResolveDeferred(table), 2u);
  EXPECT_EQ(*table.findVariable("xs")->inferredType, "list[Widget]");
  EXPECT_EQ(*table.findVariable("pairs")->inferredType, "dict[str, Widget]");
}
