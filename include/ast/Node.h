/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"

namespace pyinfer::ast {

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;
        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

        mutable int id{-1}; // pre-order identity, assigned by NumberNodes() after parsing
        int line{0}; // 1-based
        int col{0};  // 0-based byte offset within the line
    };

} // namespace pyinfer::ast
