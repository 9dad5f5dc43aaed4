#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBody.h"

namespace pyinfer::ast {
    struct WithItem {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> optionalVars; // 'as' target, may be null
    };

    struct WithStmt final : Stmt, HasBody<Stmt> {
        std::vector<WithItem> items;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
