#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/ExprContext.h"

namespace pyinfer::ast {
    struct ListLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> elements;
        ExprContext ctx{ExprContext::Load};
        ListLiteral() : Expr(NodeKind::ListLiteral) {}
    };
}
