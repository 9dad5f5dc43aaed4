#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Call.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct ClassDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;
        std::vector<KeywordArg> keywords; // metaclass=..., etc.
        std::vector<std::unique_ptr<Expr>> decorators;
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };
} // namespace pyinfer::ast
