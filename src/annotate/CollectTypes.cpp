/***
 * Name: pyinfer::annotate::CollectTypes (impl)
 */
#include "annotate/Annotator.h"
#include "sema/TypeInference.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace pyinfer::annotate {

const char* to_string(const TypeSource source) {
    switch (source) {
        case TypeSource::Annotation: return "annotation";
        case TypeSource::Inferred: return "inferred";
        case TypeSource::Suggestion: return "suggestion";
        case TypeSource::Fallback: return "fallback";
    }
    return "fallback";
}

const std::string* FunctionTypeInfo::paramType(const std::string& name) const {
    for (const auto& [param, type] : params) {
        if (param == name) return &type;
    }
    return nullptr;
}

namespace {

// Normalized value, or nullopt when it carries no information.
std::optional<std::string> informative(const std::optional<std::string>& type) {
    if (!type) return std::nullopt;
    std::string norm = NormalizeType(*type);
    if (sema::IsAny(norm)) return std::nullopt;
    return norm;
}

const FunctionSuggestion* suggestionFor(const Suggestions* suggestions, const std::string& fn) {
    if (suggestions == nullptr) return nullptr;
    const auto it = suggestions->functionSuggestions.find(fn);
    return it == suggestions->functionSuggestions.end() ? nullptr : &it->second;
}

std::string paramType(const sema::ParamSymbol& param, const FunctionSuggestion* hint) {
    if (param.annotation) return NormalizeType(*param.annotation);
    if (auto t = informative(param.defaultType)) return *t;
    if (hint != nullptr) {
        const auto it = hint->params.find(param.name);
        if (it != hint->params.end()) return NormalizeType(it->second);
    }
    if (auto t = informative(sema::NameHeuristic(param.name))) return *t;
    return sema::types::kAny;
}

std::string returnType(const sema::FunctionSymbol& fn, const FunctionSuggestion* hint) {
    if (fn.returnAnnotation) return NormalizeType(*fn.returnAnnotation);
    if (auto t = informative(fn.inferredReturn)) return *t;
    if (hint != nullptr && hint->returnType) return NormalizeType(*hint->returnType);
    if (!fn.hasValueReturn) return sema::types::kNone;
    return sema::types::kAny;
}

VariableTypeInfo variableType(const sema::VariableSymbol& var, const Suggestions* suggestions) {
    if (var.annotation) return {NormalizeType(*var.annotation), var.line, TypeSource::Annotation};
    if (auto t = informative(var.inferredType)) return {*t, var.line, TypeSource::Inferred};
    if (suggestions != nullptr) {
        const auto it = suggestions->inferences.find(var.name);
        if (it != suggestions->inferences.end()) return {NormalizeType(it->second), var.line, TypeSource::Suggestion};
    }
    return {sema::types::kAny, var.line, TypeSource::Fallback};
}

} // namespace

TypeInfo CollectTypes(const sema::SymbolTable& table, const Suggestions* suggestions) {
    TypeInfo info;
    for (const auto& [name, fn] : table.functions) {
        const FunctionSuggestion* hint = suggestionFor(suggestions, name);
        FunctionTypeInfo entry;
        entry.line = fn.line;
        // The receiver of a method is never annotated
        const std::size_t first = fn.isMethod() && !fn.hasDecorator("staticmethod") ? 1 : 0;
        for (std::size_t i = first; i < fn.params.size(); ++i) {
            entry.params.emplace_back(fn.params[i].name, paramType(fn.params[i], hint));
        }
        entry.returnType = returnType(fn, hint);
        info.functions.emplace(name, std::move(entry));
    }
    for (const auto& [name, var] : table.variables) {
        info.variables.emplace(name, variableType(var, suggestions));
    }
    return info;
}

} // namespace pyinfer::annotate
