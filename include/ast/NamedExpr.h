#pragma once
#include <memory>
#include "Expr.h"
#include "Name.h"

namespace pyinfer::ast {
    // target := value
    struct NamedExpr final : Expr {
        std::unique_ptr<Name> target;
        std::unique_ptr<Expr> value;
        NamedExpr(std::unique_ptr<Name> t, std::unique_ptr<Expr> v)
            : Expr(NodeKind::NamedExpr), target(std::move(t)), value(std::move(v)) {}
    };
}
