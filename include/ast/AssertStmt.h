#pragma once
#include <memory>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct AssertStmt final : Stmt {
        std::unique_ptr<Expr> test;
        std::unique_ptr<Expr> msg; // may be null
        AssertStmt() : Stmt(NodeKind::AssertStmt) {}
    };
}
