#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"

namespace pyinfer::ast {
    // 'elif' chains are nested IfStmt nodes in elseBody
    struct IfStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        explicit IfStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::IfStmt), cond(std::move(c)) {}
    };
} // namespace pyinfer::ast
