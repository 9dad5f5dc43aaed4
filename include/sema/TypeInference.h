/***
 * Name: pyinfer::sema::InferType
 * Purpose: Compute a best-effort descriptor for any expression.
 * Inputs:
 *   - expr: expression subtree
 *   - table: symbol table as known at the time of the call
 *   - locals: optional overlay of names whose type is known only locally
 *     (parameters of the function being walked, comprehension targets)
 * Outputs:
 *   - TypeDescriptor; Any when nothing better is known
 * Theory of Operation:
 *   Dispatches over the node kind (see ExpressionTyper). Never mutates the
 *   table. Calls to user functions whose return is not yet known produce a
 *   deferred(<name>) placeholder for ResolveDeferred.
 */
#pragma once

#include <string>
#include <unordered_map>
#include "ast/Expr.h"
#include "sema/SymbolTable.h"
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema {

    using LocalTypes = std::unordered_map<std::string, TypeDescriptor>;

    TypeDescriptor InferType(const ast::Expr& expr, const SymbolTable& table, const LocalTypes* locals = nullptr);

    // Type suggested by an identifier's spelling ("count" -> int, "paths" -> list); Any if none.
    TypeDescriptor NameHeuristic(const std::string& identifier);

} // namespace pyinfer::sema
