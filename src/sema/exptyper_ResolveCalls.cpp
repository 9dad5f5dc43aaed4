/**
 * @file
 * @brief resolveNamedCall / resolveAttributeCall: user-defined and method calls.
 */
#include "sema/detail/exptyper/CallHandlers.h"
#include "sema/detail/exptyper/BuiltinTables.h"
#include "sema/detail/ExpressionTyper.h"
#include "pyinfer/support/unicode.h"

#include <string>

namespace pyinfer::sema::detail {

TypeDescriptor resolveNamedCall(const std::string& name, const SymbolTable& table) {
    if (table.findClass(name) != nullptr) return name;
    if (const auto* fn = table.findFunction(name)) {
        if (fn->returnAnnotation) return *fn->returnAnnotation;
        if (fn->inferredReturn) return *fn->inferredReturn;
        return MakeDeferred(name);
    }
    // Probable class defined elsewhere
    if (support::StartsUppercase(name)) return name;
    return MakeDeferred(name);
}

TypeDescriptor resolveAttributeCall(const ast::Attribute& callee, const ExpressionTyper& typer) {
    const auto& table = methodReturnTable();
    const auto it = table.find(callee.attr);
    if (it == table.end()) return MakeDeferred(callee.attr);
    if (callee.attr == "copy" && callee.value) {
        auto receiver = typer.infer(*callee.value);
        if (!IsAny(receiver) && !IsDeferred(receiver)) return receiver;
    }
    return it->second;
}

} // namespace pyinfer::sema::detail
