/***
 * Name: pyinfer::annotate::TypeInfo
 * Purpose: One final, normalized type per variable and per function signature.
 * Theory of Operation:
 *   Produced by CollectTypes, consumed by AnnotateSource and the JSON report.
 *   Each entry records where its type came from.
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::annotate {

    enum class TypeSource { Annotation, Inferred, Suggestion, Fallback };

    const char* to_string(TypeSource source);

    struct VariableTypeInfo {
        std::string type;
        int line{0};
        TypeSource source{TypeSource::Fallback};
    };

    struct FunctionTypeInfo {
        std::vector<std::pair<std::string, std::string>> params; // declaration order
        std::string returnType;
        int line{0};

        const std::string* paramType(const std::string& name) const;
    };

    struct TypeInfo {
        std::map<std::string, VariableTypeInfo> variables;
        std::map<std::string, FunctionTypeInfo> functions;

        std::size_t annotationCount() const { return variables.size() + functions.size(); }
    };

} // namespace pyinfer::annotate
