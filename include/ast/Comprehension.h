/**
 * @file
 * @brief Comprehension expressions (list/set/dict/generator) and their for-clauses.
 */
#pragma once
#include <memory>
#include <vector>
#include "Expr.h"

namespace pyinfer::ast {
struct ComprehensionFor {
  std::unique_ptr<Expr> target;
  std::unique_ptr<Expr> iter;
  std::vector<std::unique_ptr<Expr>> ifs; // zero or more if guards
  bool isAsync{false};
};

struct ListComp final : Expr {
  std::unique_ptr<Expr> elt;
  std::vector<ComprehensionFor> fors;
  ListComp() : Expr(NodeKind::ListComp) {}
};

struct SetComp final : Expr {
  std::unique_ptr<Expr> elt;
  std::vector<ComprehensionFor> fors;
  SetComp() : Expr(NodeKind::SetComp) {}
};

struct DictComp final : Expr {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
  std::vector<ComprehensionFor> fors;
  DictComp() : Expr(NodeKind::DictComp) {}
};

struct GeneratorExpr final : Expr {
  std::unique_ptr<Expr> elt;
  std::vector<ComprehensionFor> fors;
  GeneratorExpr() : Expr(NodeKind::GeneratorExpr) {}
};
} // namespace pyinfer::ast
