#pragma once
#include <memory>
#include "Expr.h"
#include "ast/ExprContext.h"

namespace pyinfer::ast {
    struct Subscript final : Expr {
        std::unique_ptr<Expr> value;
        std::unique_ptr<Expr> slice; // index expression, Slice, or TupleLiteral of those
        ExprContext ctx{ExprContext::Load};
        Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
            : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
    };
}
