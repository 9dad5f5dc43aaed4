/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once
#include "Node.h"

namespace pyinfer::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pyinfer::ast
