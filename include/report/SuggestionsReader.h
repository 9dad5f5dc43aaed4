/***
 * Name: pyinfer::report::ReadSuggestions
 * Purpose: Load external type hints from JSON.
 * Inputs:
 *   - {"inferences": {name: type}, "function_suggestions":
 *      {fn: {"params": {p: type}, "return": type}}}
 * Outputs:
 *   - annotate::Suggestions
 * Theory of Operation:
 *   Entries of the wrong shape are skipped. Text that is not JSON at all, or
 *   whose top level is not an object, throws exceptions::ConfigError.
 */
#pragma once

#include <string>
#include "annotate/Suggestions.h"

namespace pyinfer::report {

annotate::Suggestions ReadSuggestions(const std::string& text);

} // namespace pyinfer::report
