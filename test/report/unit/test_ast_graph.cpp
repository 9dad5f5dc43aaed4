/***
 * Name: test_ast_graph
 * Purpose: Node/edge export and short labels.
 */
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "frontend/TreeBuilder.h"
#include "report/AstGraph.h"

#include <memory>
#include <set>
#include <string>

using namespace pyinfer;
using json = nlohmann::json;

static std::unique_ptr<ast::Module> build(const char* src) {
  std::unique_ptr<ast::Module> mod;
  frontend::SyntaxFailure failure;
  EXPECT_TRUE(frontend::BuildTree(src, "g.py", mod, failure)) << failure.message;
  return mod;
}

TEST(AstGraph, EveryNonRootNodeHasOneIncomingEdge) {
  auto mod = build("def f(a):\n    return g(a) + 1\n");
  ASSERT_NE(mod, nullptr);
  const json graph = report::AstGraph(*mod);
  const auto& nodes = graph["nodes"];
  const auto& edges = graph["edges"];
  ASSERT_FALSE(nodes.empty());
  EXPECT_EQ(edges.size(), nodes.size() - 1);
  std::set<std::string> targets;
  for (const auto& e : edges) { targets.insert(e["to"].get<std::string>()); }
  EXPECT_EQ(targets.size(), edges.size());
  EXPECT_EQ(targets.count("node_0"), 0u);
  EXPECT_EQ(nodes[0]["id"], "node_0");
  EXPECT_EQ(nodes[0]["label"], "Module");
}

TEST(AstGraph, Labels) {
  auto mod = build(
      "from os import path\n"
      "class C:\n"
      "    pass\n"
      "def f():\n"
      "    return os.getcwd()\n"
      "x = 'hi'\n"
      "y = None\n");
  ASSERT_NE(mod, nullptr);
  const json graph = report::AstGraph(*mod);
  std::set<std::string> labels;
  for (const auto& n : graph["nodes"]) { labels.insert(n["label"].get<std::string>()); }
  for (const char* expected : {"Import", "Class: C", "Func: f", "Return", "Call: os.getcwd", "Attr: getcwd",
                               "Name: os", "Assign", "Const: hi", "Const: None", "PassStmt"}) {
    EXPECT_EQ(labels.count(expected), 1u) << expected;
  }
}

TEST(AstGraph, NodeCarriesPosition) {
  auto mod = build("a = 1\n");
  ASSERT_NE(mod, nullptr);
  const json graph = report::AstGraph(*mod);
  const auto& literal = graph["nodes"].back();
  EXPECT_EQ(literal["type"], "IntLiteral");
  EXPECT_EQ(literal["label"], "Const: 1");
  EXPECT_EQ(literal["line"], 1);
  EXPECT_EQ(literal["col"], 4);
}
