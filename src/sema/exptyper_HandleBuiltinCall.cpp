/**
 * @file
 * @brief handleBuiltinCall: table lookup plus min/max/sum/sorted/list/set refinements.
 */
#include "sema/detail/exptyper/CallHandlers.h"
#include "sema/detail/exptyper/BuiltinTables.h"
#include "sema/detail/ExpressionTyper.h"
#include "sema/Unify.h"

#include <string>

namespace pyinfer::sema::detail {

bool handleBuiltinCall(const ast::Call& call, const std::string& name, const ExpressionTyper& typer,
                       TypeDescriptor& out) {
    const auto& table = builtinReturnTable();
    const auto it = table.find(name);
    if (it == table.end()) return false;
    out = it->second;

    const auto& args = call.args;
    const bool singlePlainArg = args.size() == 1 && args[0]->kind != ast::NodeKind::Starred;

    // min/max(xs) -> element type; min/max(a, b, ...) -> unify the first two
    if (name == "min" || name == "max") {
        if (singlePlainArg) {
            const auto elem = ElementType(typer.infer(*args[0]));
            if (!IsAny(elem)) out = elem;
        } else if (args.size() >= 2) {
            out = Unify({typer.infer(*args[0]), typer.infer(*args[1])});
        }
        return true;
    }

    // sum(xs) -> float only when the elements are float
    if (name == "sum") {
        out = types::kInt;
        if (!args.empty() && ElementType(typer.infer(*args[0])) == types::kFloat) out = types::kFloat;
        return true;
    }

    // sorted/list/set(xs) carry the element type of a known container
    if ((name == "sorted" || name == "list" || name == "set") && singlePlainArg) {
        const auto elem = ElementType(typer.infer(*args[0]));
        if (!IsAny(elem) && !IsDeferred(elem)) {
            out = std::string(name == "set" ? types::kSet : types::kList) + "[" + elem + "]";
        }
    }
    return true;
}

} // namespace pyinfer::sema::detail
