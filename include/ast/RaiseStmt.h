#pragma once
#include <memory>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct RaiseStmt final : Stmt {
        std::unique_ptr<Expr> exc;   // may be null (re-raise)
        std::unique_ptr<Expr> cause; // 'from' clause, may be null
        RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
    };
}
