/***
 * Name: pyinfer::ast::ComputeGeometry / NumberNodes
 * Purpose: Tree-wide walks over ForEachChild: size/depth summary and ids.
 */
#include "ast/Children.h"
#include "ast/GeometrySummary.h"

#include <algorithm>
#include <cstdint>

namespace pyinfer::ast {

namespace {
void measure(const Node& node, const uint64_t depth, GeometrySummary& out) {
    ++out.nodes;
    out.maxDepth = std::max(out.maxDepth, depth);
    ForEachChild(node, [&](const Node& child) { measure(child, depth + 1, out); });
}

void number(const Node& node, int& next) {
    node.id = next++;
    ForEachChild(node, [&](const Node& child) { number(child, next); });
}
} // namespace

GeometrySummary ComputeGeometry(const Node& root) {
    GeometrySummary out;
    measure(root, 1, out);
    return out;
}

int NumberNodes(const Node& root) {
    int next = 0;
    number(root, next);
    return next;
}

} // namespace pyinfer::ast
