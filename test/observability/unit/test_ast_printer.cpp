/***
 * Name: test_ast_printer
 * Purpose: Indented tree dump with ids, positions and node details.
 */
#include <gtest/gtest.h>
#include "frontend/TreeBuilder.h"
#include "observability/AstPrinter.h"

#include <memory>
#include <string>

using namespace pyinfer;

static std::string dump(const char* src) {
  std::unique_ptr<ast::Module> mod;
  frontend::SyntaxFailure failure;
  EXPECT_TRUE(frontend::BuildTree(src, "dump.py", mod, failure)) << failure.message;
  if (!mod) { return {}; }
  obs::AstPrinter printer;
  return printer.print(*mod);
}

TEST(AstPrinter, RootAndIndentation) {
  const auto out = dump("x = 1\n");
  EXPECT_EQ(out.rfind("Module #0 @1:0\n", 0), 0u);
  EXPECT_NE(out.find("\n  AssignStmt #1 @1:0"), std::string::npos);
  EXPECT_NE(out.find("    Name #2 @1:0 x ctx=store"), std::string::npos);
  EXPECT_NE(out.find("    IntLiteral #3 @1:4 1"), std::string::npos);
}

TEST(AstPrinter, DetailsForDefinitionsAndOperators) {
  const auto out = dump(
      "import os as o\n"
      "async def f(a, b):\n"
      "    return os.path.join(a) + b\n");
  EXPECT_NE(out.find("names=os as o"), std::string::npos);
  EXPECT_NE(out.find("name=f async params=2"), std::string::npos);
  EXPECT_NE(out.find("op=+"), std::string::npos);
  EXPECT_NE(out.find("callee=os.path.join"), std::string::npos);
}
