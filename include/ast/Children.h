/***
 * Name: pyinfer::ast::ForEachChild
 * Purpose: Enumerate the direct child nodes of any node in source order.
 * Inputs:
 *   - node: any AST node
 *   - fn: callback invoked once per direct child
 * Outputs:
 *   - none (callbacks only)
 * Theory of Operation:
 *   One exhaustive switch over NodeKind. Non-node members that carry
 *   expressions (params, keyword args, with-items, comprehension clauses,
 *   f-string segments) are flattened into their owner's child list.
 */
#pragma once

#include <functional>
#include "ast/Node.h"

namespace pyinfer::ast {

void ForEachChild(const Node& node, const std::function<void(const Node&)>& fn);

} // namespace pyinfer::ast
