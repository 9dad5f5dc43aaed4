#pragma once
#include "Expr.h"

namespace pyinfer::ast {
    struct EllipsisLiteral final : Expr {
        EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
    };
}
