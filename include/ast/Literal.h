#pragma once

#include <utility>
#include "ast/Expr.h"

namespace pyinfer::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

} // namespace pyinfer::ast
