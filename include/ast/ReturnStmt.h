#pragma once
#include <memory>
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value; // null for bare 'return'
        explicit ReturnStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };
}
