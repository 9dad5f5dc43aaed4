#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct DelStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        DelStmt() : Stmt(NodeKind::DelStmt) {}
    };
}
