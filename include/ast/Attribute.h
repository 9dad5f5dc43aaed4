#pragma once
#include <memory>
#include <string>
#include "Expr.h"
#include "ast/ExprContext.h"

namespace pyinfer::ast {
    struct Attribute final : Expr {
        std::unique_ptr<Expr> value;
        std::string attr;
        ExprContext ctx{ExprContext::Load};
        Attribute(std::unique_ptr<Expr> v, std::string a)
            : Expr(NodeKind::Attribute), value(std::move(v)), attr(std::move(a)) {}
    };
}
