/***
 * Name: pyinfer::ast::HasBodyPair
 * Purpose: Mixin for nodes that contain then/else statement lists.
 */
#pragma once
#include <memory>
#include <vector>

namespace pyinfer::ast {

template <typename StmtT>
struct HasBodyPair {
    std::vector<std::unique_ptr<StmtT>> thenBody;
    std::vector<std::unique_ptr<StmtT>> elseBody; // else/orelse; empty if absent
};

} // namespace pyinfer::ast
