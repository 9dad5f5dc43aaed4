/***
 * Name: pyinfer::annotate::Suggestions
 * Purpose: Externally supplied type hints used when inference has no answer.
 * Inputs:
 *   - inferences: variable name -> type
 *   - functionSuggestions: function name -> parameter types and return type
 * Theory of Operation:
 *   Plain data. The JSON reader (report::ReadSuggestions) drops malformed
 *   entries so a partial file still helps.
 */
#pragma once

#include <map>
#include <optional>
#include <string>

namespace pyinfer::annotate {

    struct FunctionSuggestion {
        std::map<std::string, std::string> params;
        std::optional<std::string> returnType;
    };

    struct Suggestions {
        std::map<std::string, std::string> inferences;
        std::map<std::string, FunctionSuggestion> functionSuggestions;
    };

} // namespace pyinfer::annotate
