#pragma once
#include <memory>
#include <string>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBody.h"

namespace pyinfer::ast {
    struct ExceptHandler final : Node, HasBody<Stmt> {
        std::unique_ptr<Expr> type; // may be null (bare except)
        std::string name;           // 'as' name, empty if none
        ExceptHandler() : Node(NodeKind::ExceptHandler) {}
    };
}
