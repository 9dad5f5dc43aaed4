/**
 * @file
 * @brief AST name node declarations.
 */
#pragma once
#include <string>
#include "Expr.h"
#include "ast/ExprContext.h"

namespace pyinfer::ast {

    struct Name final : Expr {
        std::string id;
        ExprContext ctx{ExprContext::Load};
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace pyinfer::ast
