#pragma once
#include <memory>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    // target: annotation [= value]
    struct AnnAssignStmt final : Stmt {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> annotation;
        std::unique_ptr<Expr> value; // may be null
        bool simple{true};           // bare, unparenthesized name target
        AnnAssignStmt() : Stmt(NodeKind::AnnAssignStmt) {}
    };
}
