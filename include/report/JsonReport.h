/***
 * Name: pyinfer::report (JSON)
 * Purpose: Serialize analysis and annotation results for --json output.
 * Outputs:
 *   - analysis: {success, ast, symbol_table, undeclared_names, error}
 *   - annotation: {success, original_code, annotated_code, type_info,
 *     annotations_count, error}
 * Theory of Operation:
 *   Tree nodes become {id: "node_<id>", node_type, lineno, col_offset,
 *   fields, children}; fields holds the node's scalar attributes only.
 *   Failed results serialize ast and symbol_table as null.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "analyzer/Analyzer.h"
#include "annotate/TypeInfo.h"
#include "ast/Node.h"
#include "sema/SymbolTable.h"
#include "sema/UndeclaredDetector.h"

namespace pyinfer::report {

nlohmann::json TreeToJson(const ast::Node& node);
nlohmann::json SymbolTableToJson(const sema::SymbolTable& table);
nlohmann::json UndeclaredToJson(const std::vector<sema::UndeclaredReference>& refs);
nlohmann::json TypeInfoToJson(const annotate::TypeInfo& info);

nlohmann::json AnalysisToJson(const AnalysisResult& result);
nlohmann::json AnnotationToJson(const AnnotationResult& result);

} // namespace pyinfer::report
