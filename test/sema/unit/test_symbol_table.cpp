/***
 * Name: test_symbol_table
 * Purpose: Declarations, scopes, parameters and implicit bindings.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/SymbolTableBuilder.h"

#include <string>

using namespace pyinfer;

static sema::SymbolTable buildTable(const char* src) {
  lex::Lexer L; L.pushString(src, "sym.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  return builder.build(*mod);
}

TEST(SymbolTable, FunctionsRecordSignatureAndReturns) {
  const auto table = buildTable(R"PY(
@cache
async def load(path: str, retries=3, flag=None, *rest, **opts) -> bytes:
    return b""

def pick(x):
    if x:
        return 1
    return "one"

def nothing():
    return
)PY");
  const auto* load = table.findFunction("load");
  ASSERT_NE(load, nullptr);
  EXPECT_TRUE(load->isAsync);
  EXPECT_EQ(load->line, 3);
  EXPECT_EQ(load->decorators, std::vector<std::string>{"cache"});
  ASSERT_EQ(load->params.size(), 5u);
  EXPECT_EQ(*load->params[0].annotation, "str");
  EXPECT_EQ(*load->params[1].defaultType, "int");
  EXPECT_TRUE(load->params[2].hasDefault);
  EXPECT_FALSE(load->params[2].defaultType.has_value());
  EXPECT_EQ(load->params[3].kind, ast::ParamKind::VarArgs);
  EXPECT_EQ(load->params[4].kind, ast::ParamKind::VarKeywords);
  EXPECT_EQ(*load->returnAnnotation, "bytes");
  EXPECT_EQ(load->paramNames(), (std::vector<std::string>{"path", "retries", "flag", "rest", "opts"}));

  const auto* pick = table.findFunction("pick");
  ASSERT_NE(pick, nullptr);
  EXPECT_TRUE(pick->hasValueReturn);
  EXPECT_EQ(*pick->inferredReturn, "int | str");

  const auto* nothing = table.findFunction("nothing");
  ASSERT_NE(nothing, nullptr);
  EXPECT_FALSE(nothing->hasValueReturn);
  EXPECT_FALSE(nothing->inferredReturn.has_value());
}

TEST(SymbolTable, ParametersInformReturnInference) {
  const auto table = buildTable(R"PY(
def scale(factor: float, count=2):
    return factor * count

def greet(name):
    return "hi " + name
)PY");
  EXPECT_EQ(*table.findFunction("scale")->inferredReturn, "float");
  EXPECT_EQ(*table.findFunction("greet")->inferredReturn, "str");
}

TEST(SymbolTable, ClassesAndMethods) {
  const auto table = buildTable(R"PY(
@dataclass
class Car(Vehicle, mixins.Loud):
    def drive(self, speed):
        pass
    @staticmethod
    def honk():
        pass
)PY");
  const auto* car = table.findClass("Car");
  ASSERT_NE(car, nullptr);
  EXPECT_EQ(car->bases, (std::vector<std::string>{"Vehicle", "mixins.Loud"}));
  EXPECT_EQ(car->decorators, std::vector<std::string>{"dataclass"});
  EXPECT_EQ(car->methods, (std::vector<std::string>{"drive", "honk"}));
  const auto* drive = table.findFunction("drive");
  ASSERT_NE(drive, nullptr);
  EXPECT_TRUE(drive->isMethod());
  EXPECT_EQ(drive->enclosingClass, "Car");
  EXPECT_EQ(drive->scopeDepth, 1);
  EXPECT_TRUE(table.findFunction("honk")->hasDecorator("staticmethod"));
}

TEST(SymbolTable, NestedFunctionsAreNotMethods) {
  const auto table = buildTable(R"PY(
class Outer:
    def method(self):
        def inner():
            return 1
        return inner()
)PY");
  const auto* inner = table.findFunction("inner");
  ASSERT_NE(inner, nullptr);
  EXPECT_FALSE(inner->isMethod());
  EXPECT_EQ(inner->scopeDepth, 2);
}

TEST(SymbolTable, VariablesAndGlobalScope) {
  const auto table = buildTable(R"PY(
limit: int = 10
names = ["a"]
def f():
    local = 1
)PY");
  const auto* limit = table.findVariable("limit");
  ASSERT_NE(limit, nullptr);
  EXPECT_EQ(*limit->annotation, "int");
  EXPECT_EQ(limit->line, 2);
  EXPECT_EQ(*table.findVariable("names")->inferredType, "list[str]");
  const auto* local = table.findVariable("local");
  ASSERT_NE(local, nullptr);
  EXPECT_EQ(local->scopeDepth, 1);
  EXPECT_EQ(table.globalScope.count("limit"), 1u);
  EXPECT_EQ(table.globalScope.count("f"), 1u);
  EXPECT_EQ(table.globalScope.at("f").kind, sema::SymbolKind::Function);
  EXPECT_EQ(table.globalScope.count("local"), 0u);
}

TEST(SymbolTable, Imports) {
  const auto table = buildTable(R"PY(
import os.path
import numpy as np
from collections import OrderedDict as OD, deque
from ..core import engine
)PY");
  const auto* os = table.findImport("os");
  ASSERT_NE(os, nullptr);
  EXPECT_EQ(os->module, "os.path");
  EXPECT_EQ(os->kind, sema::ImportKind::Module);
  const auto* np = table.findImport("np");
  ASSERT_NE(np, nullptr);
  EXPECT_EQ(*np->alias, "np");
  const auto* od = table.findImport("OD");
  ASSERT_NE(od, nullptr);
  EXPECT_EQ(od->kind, sema::ImportKind::Selective);
  EXPECT_EQ(*od->originalName, "OrderedDict");
  EXPECT_EQ(od->module, "collections");
  EXPECT_EQ(table.findImport("engine")->module, "..core");
  EXPECT_TRUE(table.declares("deque"));
}

TEST(SymbolTable, ImplicitBindings) {
  const auto table = buildTable(R"PY(
for i, (j, *rest) in pairs:
    pass
with open(p) as fh:
    pass
try:
    pass
except ValueError as err:
    pass
if (m := 3):
    pass
f = lambda a: a
squares = [sq for sq in range(3)]
def g():
    global counter
)PY");
  for (const char* name : {"i", "j", "rest", "fh", "err", "m", "a", "sq", "counter"}) {
    EXPECT_EQ(table.implicitBindings.count(name), 1u) << name;
    EXPECT_TRUE(table.declares(name)) << name;
  }
  EXPECT_FALSE(table.declares("pairs"));
}

TEST(SymbolTable, RebuildingStartsFresh) {
  lex::Lexer L; L.pushString("a = 1\n", "r.py");
  parse::Parser P(L);
  auto mod = P.parseModule();
  sema::SymbolTableBuilder builder;
  (void)builder.build(*mod);
  const auto second = builder.build(*mod);
  EXPECT_EQ(second.variables.size(), 1u);
}
