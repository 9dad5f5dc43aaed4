/**
 * @file
 * @brief Arithmetic, bitwise and shift operators.
 */
#pragma once

#include <memory>
#include "BinaryOperator.h"
#include "Expr.h"

namespace pyinfer::ast {
    struct Binary final : Expr {
        BinaryOperator op;
        std::unique_ptr<Expr> lhs;
        std::unique_ptr<Expr> rhs;
        Binary(const BinaryOperator o, std::unique_ptr<Expr> a, std::unique_ptr<Expr> b)
            : Expr(NodeKind::BinaryExpr), op(o), lhs(std::move(a)), rhs(std::move(b)) {
        }
    };
} // namespace pyinfer::ast
