#pragma once
#include "Stmt.h"

namespace pyinfer::ast {
    struct ContinueStmt final : Stmt {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
