#pragma once
#include <memory>
#include <vector>
#include "Expr.h"

namespace pyinfer::ast {
    struct SetLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> elements;
        SetLiteral() : Expr(NodeKind::SetLiteral) {}
    };
}
