/***
 * Name: pyinfer::sema::TypeDescriptor
 * Purpose: Normalized textual type values and helpers to take them apart.
 * Theory of Operation:
 *   A descriptor is one of: a primitive ("int", "str", "None", ...), a
 *   parametrized container ("list[int]", "dict[str, int]", "tuple[int, str]",
 *   "tuple[int, ...]"), a union of at most three members joined by " | ",
 *   a nominal class name, "Any", or a deferred placeholder "deferred(<name>)"
 *   that stands in for a call whose result is not known during the build pass.
 *   Helpers split at top level only, so "dict[str, int | None]" keeps its
 *   inner union intact.
 */
#pragma once

#include <string>
#include <vector>

namespace pyinfer::sema {

    using TypeDescriptor = std::string;

    namespace types {
        inline constexpr const char* kAny = "Any";
        inline constexpr const char* kInt = "int";
        inline constexpr const char* kFloat = "float";
        inline constexpr const char* kComplex = "complex";
        inline constexpr const char* kStr = "str";
        inline constexpr const char* kBool = "bool";
        inline constexpr const char* kBytes = "bytes";
        inline constexpr const char* kNone = "None";
        inline constexpr const char* kList = "list";
        inline constexpr const char* kSet = "set";
        inline constexpr const char* kDict = "dict";
        inline constexpr const char* kTuple = "tuple";
        inline constexpr const char* kGenerator = "generator";
        inline constexpr const char* kSlice = "slice";
        inline constexpr const char* kRange = "range";
        inline constexpr const char* kUnionSep = " | ";
    } // namespace types

    bool IsAny(const TypeDescriptor& t);

    bool IsNumeric(const TypeDescriptor& t);

    // deferred(<name>)
    TypeDescriptor MakeDeferred(const std::string& name);

    bool IsDeferred(const TypeDescriptor& t);

    // Name inside deferred(...); empty when t is not a placeholder.
    std::string DeferredTarget(const TypeDescriptor& t);

    // Split on sep wherever bracket depth is zero; pieces are trimmed.
    std::vector<std::string> SplitTopLevel(const std::string& text, const std::string& sep);

    // "list[int]" -> head "list", args {"int"}; false when t has no parameters.
    bool SplitGeneric(const TypeDescriptor& t, std::string& head, std::vector<TypeDescriptor>& args);

    // Container head without parameters ("dict[str, int]" -> "dict").
    std::string BaseName(const TypeDescriptor& t);

    std::vector<TypeDescriptor> UnionMembers(const TypeDescriptor& t);

    std::string JoinTypes(const std::vector<TypeDescriptor>& parts, const std::string& sep);

    // Type produced by iterating over a value of type t; Any when unknown.
    TypeDescriptor ElementType(const TypeDescriptor& t);

} // namespace pyinfer::sema
