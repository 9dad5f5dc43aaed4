#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"

namespace pyinfer::ast {
    // name=value; an empty name marks a '**expr' argument
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr {
        std::unique_ptr<Expr> callee;            // typically Name or Attribute
        std::vector<std::unique_ptr<Expr>> args; // positional, '*expr' as Starred
        std::vector<KeywordArg> keywords;
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pyinfer::ast
