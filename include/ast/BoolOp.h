#pragma once

#include <memory>
#include <vector>
#include "BinaryOperator.h"
#include "Expr.h"

namespace pyinfer::ast {
    // a and b and c -> one BoolOp with three values
    struct BoolOp final : Expr {
        BinaryOperator op{BinaryOperator::And}; // And | Or
        std::vector<std::unique_ptr<Expr>> values;
        explicit BoolOp(const BinaryOperator o) : Expr(NodeKind::BoolOp), op(o) {}
    };
}
