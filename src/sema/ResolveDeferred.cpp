/***
 * Name: pyinfer::sema::ResolveDeferred (impl)
 */
#include "sema/ResolveDeferred.h"
#include "sema/Unify.h"
#include "pyinfer/support/unicode.h"

#include <optional>
#include <string>
#include <vector>

namespace pyinfer::sema {

namespace {
bool hasPlaceholder(const TypeDescriptor& t) { return t.find("deferred(") != std::string::npos; }

std::optional<TypeDescriptor> resolveTarget(const std::string& target, const SymbolTable& table) {
    if (table.findClass(target) != nullptr) return target;
    if (const auto* fn = table.findFunction(target)) {
        if (fn->returnAnnotation) return *fn->returnAnnotation;
        if (fn->inferredReturn && !hasPlaceholder(*fn->inferredReturn)) return *fn->inferredReturn;
    }
    if (support::StartsUppercase(target)) return target;
    return std::nullopt;
}

// Rewrites t in place, descending into container parameters; true when something changed.
bool resolveDescriptor(TypeDescriptor& t, const SymbolTable& table) {
    if (!hasPlaceholder(t)) return false;
    auto members = UnionMembers(t);
    bool changed = false;
    for (auto& m : members) {
        if (IsDeferred(m)) {
            if (auto resolved = resolveTarget(DeferredTarget(m), table)) {
                m = std::move(*resolved);
                changed = true;
            }
            continue;
        }
        std::string head;
        std::vector<TypeDescriptor> args;
        if (!SplitGeneric(m, head, args)) continue;
        bool argChanged = false;
        for (auto& arg : args) { argChanged = resolveDescriptor(arg, table) || argChanged; }
        if (argChanged) {
            m = head + "[" + JoinTypes(args, ", ") + "]";
            changed = true;
        }
    }
    if (!changed) return false;
    t = members.size() == 1 ? members.front() : UnionOf(members);
    return true;
}
} // namespace

std::size_t ResolveDeferred(SymbolTable& table) {
    std::size_t rewritten = 0;
    for (auto& [name, fn] : table.functions) {
        if (fn.inferredReturn && resolveDescriptor(*fn.inferredReturn, table)) ++rewritten;
    }
    for (auto& [name, var] : table.variables) {
        if (var.inferredType && resolveDescriptor(*var.inferredType, table)) ++rewritten;
    }
    return rewritten;
}

} // namespace pyinfer::sema
