/***
 * Name: pyinfer::annotate (synthesizer)
 * Purpose: Turn a finished SymbolTable into source text carrying type annotations.
 * Inputs:
 *   - SymbolTable (after ResolveDeferred), optional Suggestions, original text
 * Outputs:
 *   - TypeInfo and the rewritten text
 * Theory of Operation:
 *   CollectTypes picks one type per entry by priority:
 *     parameters: annotation > default type > suggestion > name heuristic > Any
 *     returns:    annotation > inferred > suggestion > None (no value return) > Any
 *     variables:  annotation > inferred (unless it normalizes to Any) > suggestion > Any
 *   The first parameter of a non-static method is left out. Every type passes
 *   through NormalizeType.
 *
 *   AnnotateSource works on lines, not on the tree. A function line is
 *   rewritten when it is a single-line "def name(...):" with no "->" and no
 *   annotated parameter; a variable line when it reads "name = ..." and does
 *   not already contain "name:". Multi-line signatures, multiple targets and
 *   semicolon-joined statements are left alone. Running it on its own output
 *   changes nothing.
 */
#pragma once

#include <string>
#include "annotate/Suggestions.h"
#include "annotate/TypeInfo.h"
#include "sema/SymbolTable.h"

namespace pyinfer::annotate {

    // Empty, "unknown" and anything with a deferred placeholder -> Any;
    // NoneType -> None, TextIOWrapper -> TextIO, generator -> Generator.
    std::string NormalizeType(const std::string &type);

    TypeInfo CollectTypes(const sema::SymbolTable &table, const Suggestions *suggestions = nullptr);

    std::string AnnotateSource(const std::string &source, const TypeInfo &info);

} // namespace pyinfer::annotate
