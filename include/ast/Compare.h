#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/BinaryOperator.h"

namespace pyinfer::ast {
struct Compare final : Expr {
  std::unique_ptr<Expr> left;
  std::vector<BinaryOperator> ops;
  std::vector<std::unique_ptr<Expr>> comparators; // length equals ops.size()
  Compare() : Expr(NodeKind::Compare) {}
};
} // namespace pyinfer::ast
