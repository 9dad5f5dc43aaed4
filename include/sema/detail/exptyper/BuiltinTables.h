/***
 * @file
 * @brief Immutable lookup tables consulted by the expression typer.
 *
 * Each table is built once on first use and never modified afterwards.
 */
#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema::detail {

    // Builtin callee name -> return descriptor
    const std::unordered_map<std::string, TypeDescriptor>& builtinReturnTable();

    // Method name -> return descriptor for attribute calls
    const std::unordered_map<std::string, TypeDescriptor>& methodReturnTable();

    // Ordered (lower-case substring, descriptor) pairs for the naming heuristic
    const std::vector<std::pair<std::string, TypeDescriptor>>& namePatternTable();

    // "<module>.<attribute>" -> descriptor
    const std::unordered_map<std::string, TypeDescriptor>& moduleAttributeTable();

} // namespace pyinfer::sema::detail
