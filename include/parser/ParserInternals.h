/***
 * Name: pyinfer::parse::detail
 * Purpose: Small helpers shared by the parser translation units.
 */
#pragma once

#include "ast/Node.h"
#include "lexer/Token.h"

namespace pyinfer::parse::detail {

// Copy a token position onto a node (tree columns are 0-based).
template <typename T>
T& stamp(T& node, const lex::Token& tok) {
  node.line = tok.line;
  node.col = tok.col - 1;
  return node;
}

// Copy another node's position (binary operators take their left operand's).
template <typename T>
T& stampFrom(T& node, const ast::Node& from) {
  node.line = from.line;
  node.col = from.col;
  return node;
}

} // namespace pyinfer::parse::detail
