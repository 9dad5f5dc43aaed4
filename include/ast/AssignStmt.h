/**
 * @file
 * @brief Plain assignment: one or more targets sharing one value (a = b = v).
 */
#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct AssignStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
    };
}
