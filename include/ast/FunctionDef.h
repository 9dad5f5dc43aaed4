#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/HasParams.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct FunctionDef final : Stmt, HasBody<Stmt>, HasParams<Param>, HasName {
        std::unique_ptr<Expr> returns;                 // '-> T' annotation, may be null
        std::vector<std::unique_ptr<Expr>> decorators; // in source order
        bool isAsync{false};
        explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

} // namespace pyinfer::ast
