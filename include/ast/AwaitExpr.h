#pragma once
#include <memory>
#include "Expr.h"

namespace pyinfer::ast {
    struct AwaitExpr final : Expr {
        std::unique_ptr<Expr> value;
        explicit AwaitExpr(std::unique_ptr<Expr> v) : Expr(NodeKind::AwaitExpr), value(std::move(v)) {}
    };
}
