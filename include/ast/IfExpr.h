#pragma once
#include <memory>
#include "Expr.h"

namespace pyinfer::ast {
    // body if test else orelse
    struct IfExpr final : Expr {
        std::unique_ptr<Expr> body;
        std::unique_ptr<Expr> test;
        std::unique_ptr<Expr> orelse;
        IfExpr() : Expr(NodeKind::IfExpr) {}
    };
}
