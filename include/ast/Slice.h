#pragma once
#include <memory>
#include "Expr.h"

namespace pyinfer::ast {
    // lower:upper:step, each part optional
    struct Slice final : Expr {
        std::unique_ptr<Expr> lower;
        std::unique_ptr<Expr> upper;
        std::unique_ptr<Expr> step;
        Slice() : Expr(NodeKind::Slice) {}
    };
}
