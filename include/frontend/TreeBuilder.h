/***
 * Name: pyinfer::frontend::BuildTree
 * Purpose: Turn source text into a numbered syntax tree or a syntax failure.
 * Inputs:
 *   - source: module text
 *   - name: file name used in positions and messages
 * Outputs:
 *   - out: Module root on success (every node numbered in pre-order, Module = 0)
 *   - failure: message and 1-based position on failure
 * Theory of Operation: Runs Lexer + Parser over the whole buffer. Any
 *   ParseError becomes a SyntaxFailure; a partial tree is never returned.
 */
#pragma once

#include "ast/Module.h"

#include <memory>
#include <string>

namespace pyinfer::obs { class Metrics; }

namespace pyinfer::frontend {

struct SyntaxFailure {
  std::string message;
  int line{0};
  int col{0};
};

bool BuildTree(const std::string& source, const std::string& name, std::unique_ptr<ast::Module>& out,
               SyntaxFailure& failure, obs::Metrics* metrics = nullptr);

}  // namespace pyinfer::frontend
