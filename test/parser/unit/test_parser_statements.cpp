/***
 * Name: test_parser_statements
 * Purpose: Statement forms, suites and positions produced by the parser.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

#include <memory>

using namespace pyinfer;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  lex::Lexer L; L.pushString(src, "stmt.py");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(ParserStatements, FunctionWithDefaultsAnnotationsAndDecorators) {
  auto mod = parseSrc(R"PY(
@staticmethod
async def fetch(url: str, retries=3, *args, timeout: float = 1.0, **kw) -> bytes:
    return b""
)PY");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::FunctionDef);
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  EXPECT_EQ(fn.name, "fetch");
  EXPECT_TRUE(fn.isAsync);
  EXPECT_EQ(fn.decorators.size(), 1u);
  ASSERT_EQ(fn.params.size(), 5u);
  EXPECT_TRUE(fn.params[0].annotation != nullptr);
  EXPECT_TRUE(fn.params[1].defaultValue != nullptr);
  EXPECT_TRUE(fn.params[3].annotation != nullptr && fn.params[3].defaultValue != nullptr);
  ASSERT_TRUE(fn.returns != nullptr);
  EXPECT_EQ(fn.line, 3);
  EXPECT_EQ(fn.col, 0);
}

TEST(ParserStatements, ClassWithBasesAndMethods) {
  auto mod = parseSrc(R"PY(
class Car(Vehicle, metaclass=Meta):
    wheels = 4
    def drive(self):
        pass
)PY");
  const auto& cls = static_cast<const ast::ClassDef&>(*mod->body[0]);
  EXPECT_EQ(cls.name, "Car");
  EXPECT_EQ(cls.bases.size(), 1u);
  EXPECT_EQ(cls.keywords.size(), 1u);
  ASSERT_EQ(cls.body.size(), 2u);
  EXPECT_EQ(cls.body[1]->kind, ast::NodeKind::FunctionDef);
  EXPECT_EQ(cls.body[1]->col, 4);
}

TEST(ParserStatements, ControlFlowForms) {
  auto mod = parseSrc(R"PY(
if a:
    x = 1
elif b:
    x = 2
else:
    x = 3
for i, j in pairs:
    continue
else:
    pass
while n > 0:
    n -= 1
try:
    risky()
except (ValueError, KeyError) as err:
    raise RuntimeError("bad") from err
else:
    ok = True
finally:
    done()
with open(p) as fh, lock:
    data = fh.read()
)PY");
  ASSERT_EQ(mod->body.size(), 5u);
  const auto& iff = static_cast<const ast::IfStmt&>(*mod->body[0]);
  ASSERT_EQ(iff.elseBody.size(), 1u);
  EXPECT_EQ(iff.elseBody[0]->kind, ast::NodeKind::IfStmt);
  const auto& loop = static_cast<const ast::ForStmt&>(*mod->body[1]);
  EXPECT_EQ(loop.target->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(loop.elseBody.size(), 1u);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::WhileStmt);
  const auto& tr = static_cast<const ast::TryStmt&>(*mod->body[3]);
  ASSERT_EQ(tr.handlers.size(), 1u);
  EXPECT_EQ(tr.handlers[0]->name, "err");
  EXPECT_EQ(tr.orelse.size(), 1u);
  EXPECT_EQ(tr.finalbody.size(), 1u);
  const auto& with = static_cast<const ast::WithStmt&>(*mod->body[4]);
  EXPECT_EQ(with.items.size(), 2u);
  EXPECT_TRUE(with.items[0].optionalVars != nullptr);
}

TEST(ParserStatements, ImportsAndScopeDeclarations) {
  auto mod = parseSrc(R"PY(
import os.path as osp, sys
from ..pkg import (a, b as c)
from . import sibling
def f():
    global counter
    nonlocal_name = 1
)PY");
  const auto& imp = static_cast<const ast::Import&>(*mod->body[0]);
  ASSERT_EQ(imp.names.size(), 2u);
  EXPECT_EQ(imp.names[0].name, "os.path");
  EXPECT_EQ(imp.names[0].asname, "osp");
  const auto& from = static_cast<const ast::ImportFrom&>(*mod->body[1]);
  EXPECT_EQ(from.level, 2);
  EXPECT_EQ(from.module, "pkg");
  ASSERT_EQ(from.names.size(), 2u);
  EXPECT_EQ(from.names[1].asname, "c");
  const auto& rel = static_cast<const ast::ImportFrom&>(*mod->body[2]);
  EXPECT_EQ(rel.level, 1);
  EXPECT_TRUE(rel.module.empty());
}

TEST(ParserStatements, AssignmentTargetsGetStoreContext) {
  auto mod = parseSrc("a, *b = c = items\nobj.attr: int = 3\ndel d[0]\n");
  const auto& assign = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  ASSERT_EQ(assign.targets.size(), 2u);
  const auto& tup = static_cast<const ast::TupleLiteral&>(*assign.targets[0]);
  EXPECT_EQ(tup.ctx, ast::ExprContext::Store);
  EXPECT_EQ(tup.elements[1]->kind, ast::NodeKind::Starred);
  const auto& name = static_cast<const ast::Name&>(*assign.targets[1]);
  EXPECT_EQ(name.ctx, ast::ExprContext::Store);
  const auto& ann = static_cast<const ast::AnnAssignStmt&>(*mod->body[1]);
  EXPECT_FALSE(ann.simple);
  const auto& del = static_cast<const ast::DelStmt&>(*mod->body[2]);
  ASSERT_EQ(del.targets.size(), 1u);
  EXPECT_EQ(static_cast<const ast::Subscript&>(*del.targets[0]).ctx, ast::ExprContext::Del);
}

TEST(ParserStatements, SemicolonSeparatedSimpleStatements) {
  auto mod = parseSrc("a = 1; b = 2; pass\nif a: b = 3; c = 4\n");
  ASSERT_EQ(mod->body.size(), 4u);
  const auto& iff = static_cast<const ast::IfStmt&>(*mod->body[3]);
  EXPECT_EQ(iff.thenBody.size(), 2u);
}
