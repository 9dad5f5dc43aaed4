#pragma once
#include <string>
#include <vector>
#include "Stmt.h"

namespace pyinfer::ast {
    struct GlobalStmt final : Stmt {
        std::vector<std::string> names;
        GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
    };
}
