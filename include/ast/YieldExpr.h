#pragma once
#include <memory>
#include "Expr.h"

namespace pyinfer::ast {
    struct YieldExpr final : Expr {
        std::unique_ptr<Expr> value; // may be null
        bool isFrom{false};          // 'yield from'
        YieldExpr() : Expr(NodeKind::YieldExpr) {}
    };
}
