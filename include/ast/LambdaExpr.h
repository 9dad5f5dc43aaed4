#pragma once
#include <memory>
#include "Expr.h"
#include "ast/HasParams.h"
#include "ast/Param.h"

namespace pyinfer::ast {
    struct LambdaExpr final : Expr, HasParams<Param> {
        std::unique_ptr<Expr> body;
        LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
    };
}
