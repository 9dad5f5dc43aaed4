#pragma once
#include <memory>
#include <vector>
#include "ExceptHandler.h"
#include "Stmt.h"
#include "ast/HasBody.h"

namespace pyinfer::ast {
    struct TryStmt final : Stmt, HasBody<Stmt> {
        std::vector<std::unique_ptr<ExceptHandler>> handlers;
        std::vector<std::unique_ptr<Stmt>> orelse;
        std::vector<std::unique_ptr<Stmt>> finalbody;
        TryStmt() : Stmt(NodeKind::TryStmt) {}
    };
}
