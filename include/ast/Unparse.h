/***
 * Name: pyinfer::ast::RenderExpr
 * Purpose: Render an expression back to compact source text.
 * Theory of Operation:
 *   Used for annotations, decorators and base classes. String constants
 *   render as their contents so that forward references ("Node") read as
 *   type names. Constructs with no compact spelling render as "...".
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

std::string RenderExpr(const Expr& expr);

// Dotted name for Name/Attribute chains, the callee's name for calls,
// otherwise RenderExpr().
std::string DottedName(const Expr& expr);

} // namespace pyinfer::ast
