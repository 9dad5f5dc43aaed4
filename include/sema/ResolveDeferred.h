/***
 * Name: pyinfer::sema::ResolveDeferred
 * Purpose: Refine deferred(<name>) placeholders once the whole table exists.
 * Inputs:
 *   - table: finished SymbolTable (mutated in place)
 * Outputs:
 *   - number of entries whose descriptor changed
 * Theory of Operation:
 *   One pass over function inferred returns, then one pass over variable
 *   inferred types. Each placeholder (alone or as a union member) becomes:
 *     1. the class name when <name> is a known class,
 *     2. the function's annotated or inferred return when <name> is a known
 *        function and that return carries no placeholder itself,
 *     3. <name> itself when it starts with an uppercase letter.
 *   Anything else stays deferred; the annotation synthesizer normalizes it
 *   to Any. No fixpoint iteration.
 */
#pragma once

#include <cstddef>
#include "sema/SymbolTable.h"

namespace pyinfer::sema {

    std::size_t ResolveDeferred(SymbolTable &table);

} // namespace pyinfer::sema
