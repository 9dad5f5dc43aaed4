#pragma once
#include "Stmt.h"

namespace pyinfer::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
