/**
 * @file
 * @brief AST geometry summary and node numbering.
 */
#pragma once

#include <cstdint>
#include "ast/Node.h"

namespace pyinfer::ast {
    struct GeometrySummary { uint64_t nodes{0}; uint64_t maxDepth{0}; };

    // Count nodes and the deepest root-to-leaf path (root depth is 1).
    GeometrySummary ComputeGeometry(const Node& root);

    // Assign dense pre-order ids starting at 0; returns the number of nodes.
    int NumberNodes(const Node& root);
}
