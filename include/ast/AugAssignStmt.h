#pragma once
#include <memory>
#include "BinaryOperator.h"
#include "Expr.h"
#include "Stmt.h"

namespace pyinfer::ast {
    struct AugAssignStmt final : Stmt {
        std::unique_ptr<Expr> target;
        BinaryOperator op{BinaryOperator::Add};
        std::unique_ptr<Expr> value;
        AugAssignStmt(std::unique_ptr<Expr> t, const BinaryOperator o, std::unique_ptr<Expr> v)
            : Stmt(NodeKind::AugAssignStmt), target(std::move(t)), op(o), value(std::move(v)) {}
    };
}
