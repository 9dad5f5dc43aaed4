#pragma once
#include <memory>
#include "Expr.h"
#include "UnaryOperator.h"

namespace pyinfer::ast {
    struct Unary final : Expr {
        UnaryOperator op;
        std::unique_ptr<Expr> operand;
        Unary(const UnaryOperator o, std::unique_ptr<Expr> e)
            : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(e)) {}
    };
}
