/**
 * @file
 * @brief f-string literal: alternating text and replacement-field segments.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"

namespace pyinfer::ast {
struct FStringSegment {
  bool isExpr{false};
  std::string text;           // when !isExpr
  std::unique_ptr<Expr> expr; // when isExpr; conversion and format spec are dropped
};

struct FStringLiteral final : Expr {
  std::vector<FStringSegment> parts;
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};
} // namespace pyinfer::ast
