#pragma once
#include "Stmt.h"

namespace pyinfer::ast {
    struct BreakStmt final : Stmt {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
