#pragma once
#include <memory>
#include <utility>
#include <vector>
#include "Expr.h"

namespace pyinfer::ast {
struct DictLiteral final : Expr {
  // key:value entries in source order; a null key marks a '**value' unpack entry
  std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Expr>>> items;
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};
} // namespace pyinfer::ast
