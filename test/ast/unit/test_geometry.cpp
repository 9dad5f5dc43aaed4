/***
 * Name: test_geometry
 * Purpose: Cover pre-order numbering, geometry summary and expression rendering.
 */
#include <gtest/gtest.h>
#include "ast/Children.h"
#include "ast/GeometrySummary.h"
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

#include <memory>
#include <set>

using namespace pyinfer;

static std::unique_ptr<ast::Module> parseSrcGeom(const char* src) {
  lex::Lexer L; L.pushString(src, "geo.py");
  parse::Parser P(L);
  return P.parseModule();
}

static void collectIds(const ast::Node& n, std::set<int>& ids) {
  ids.insert(n.id);
  ast::ForEachChild(n, [&ids](const ast::Node& c) { collectIds(c, ids); });
}

TEST(Geometry, NestedDepthIncreases) {
  auto modS = parseSrcGeom("x = 1 + 2\n");
  auto modD = parseSrcGeom("x = 1 + (2 * (3 + 4))\n");
  const auto gS = ast::ComputeGeometry(*modS);
  const auto gD = ast::ComputeGeometry(*modD);
  EXPECT_GT(gS.nodes, 0u);
  EXPECT_GT(gD.nodes, gS.nodes);
  EXPECT_GT(gD.maxDepth, gS.maxDepth);
}

TEST(Geometry, NumberingIsDensePreOrder) {
  auto mod = parseSrcGeom(
      "def f(a, b):\n"
      "    return a + b\n"
      "y = f(1, 2)\n");
  const int count = ast::NumberNodes(*mod);
  EXPECT_EQ(mod->id, 0);
  std::set<int> ids;
  collectIds(*mod, ids);
  ASSERT_EQ(static_cast<int>(ids.size()), count);
  EXPECT_EQ(*ids.begin(), 0);
  EXPECT_EQ(*ids.rbegin(), count - 1);
  EXPECT_EQ(static_cast<uint64_t>(count), ast::ComputeGeometry(*mod).nodes);
  EXPECT_EQ(mod->body[0]->id, 1);
}

TEST(Geometry, RenumberingIsStable) {
  auto mod = parseSrcGeom("a = [1, 2]\n");
  const int first = ast::NumberNodes(*mod);
  const int second = ast::NumberNodes(*mod);
  EXPECT_EQ(first, second);
  EXPECT_EQ(mod->id, 0);
}

TEST(Unparse, RendersAnnotationsAndDottedNames) {
  auto mod = parseSrcGeom(
      "x: dict[str, list[int]] = {}\n"
      "y: 'Node' = None\n"
      "z = os.path.join('a')\n"
      "w: int | None = None\n");
  const auto& ann = static_cast<const ast::AnnAssignStmt&>(*mod->body[0]);
  EXPECT_EQ(ast::RenderExpr(*ann.annotation), "dict[str, list[int]]");
  const auto& fwd = static_cast<const ast::AnnAssignStmt&>(*mod->body[1]);
  EXPECT_EQ(ast::RenderExpr(*fwd.annotation), "Node");
  const auto& assign = static_cast<const ast::AssignStmt&>(*mod->body[2]);
  EXPECT_EQ(ast::DottedName(*assign.value), "os.path.join");
  const auto& opt = static_cast<const ast::AnnAssignStmt&>(*mod->body[3]);
  EXPECT_EQ(ast::RenderExpr(*opt.annotation), "int | None");
}
