#pragma once
#include "Expr.h"

namespace pyinfer::ast {
    struct NoneLiteral final : Expr {
        NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
    };
}
