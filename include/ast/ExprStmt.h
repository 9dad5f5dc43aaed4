#pragma once
#include <memory>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct ExprStmt final : Stmt {
        std::unique_ptr<Expr> value;
        explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
    };
}
