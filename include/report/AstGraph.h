/***
 * Name: pyinfer::report::AstGraph
 * Purpose: Node/edge export of a numbered tree for graph viewers.
 * Outputs:
 *   - {nodes: [{id, label, type, line, col}], edges: [{from, to}]}
 * Theory of Operation:
 *   Pre-order walk; labels are short ("Func: main", "Name: x", "Const: 1")
 *   for the common kinds and the kind name otherwise.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "ast/Module.h"

namespace pyinfer::report {

std::string GraphLabel(const ast::Node& node);

nlohmann::json AstGraph(const ast::Module& mod);

} // namespace pyinfer::report
