/***
 * Name: ExpressionTyper::visit(Name/Attribute/Subscript/Call)
 * Purpose: Resolve references through the overlay and the symbol table, and
 *          project attribute, subscript and call results.
 */
#include "sema/detail/ExpressionTyper.h"
#include "sema/detail/exptyper/AccessHandlers.h"
#include "sema/detail/exptyper/CallHandlers.h"

#include <string>

using namespace pyinfer;
using namespace pyinfer::sema;

void ExpressionTyper::visit(const ast::Name& name) {
    if (locals) {
        const auto it = locals->find(name.id);
        if (it != locals->end()) { out = it->second; return; }
    }
    if (const auto* var = table->findVariable(name.id)) {
        if (var->annotation) { out = *var->annotation; return; }
        if (var->inferredType && !IsAny(*var->inferredType)) { out = *var->inferredType; return; }
    }
    out = NameHeuristic(name.id);
}

void ExpressionTyper::visit(const ast::Attribute& attribute) {
    out = types::kAny;
    if (!attribute.value) return;
    std::string module;
    if (attribute.value->kind == ast::NodeKind::Name) {
        const auto& base = static_cast<const ast::Name&>(*attribute.value);
        const auto* imported = table->findImport(base.id);
        const bool shadowed = locals && locals->count(base.id) != 0;
        if (imported && !shadowed && imported->kind == ImportKind::Module) module = imported->module;
    }
    const auto baseType = module.empty() ? infer(*attribute.value) : TypeDescriptor{};
    out = detail::projectAttribute(baseType, module, attribute.attr);
}

void ExpressionTyper::visit(const ast::Subscript& subscript) {
    out = types::kAny;
    if (!subscript.value || !subscript.slice) return;
    out = detail::projectSubscript(infer(*subscript.value), *subscript.slice);
}

void ExpressionTyper::visit(const ast::Call& call) {
    out = types::kAny;
    if (!call.callee) return;
    if (call.callee->kind == ast::NodeKind::Name) {
        const auto& name = static_cast<const ast::Name&>(*call.callee).id;
        if (detail::handleBuiltinCall(call, name, *this, out)) return;
        out = detail::resolveNamedCall(name, *table);
        return;
    }
    if (call.callee->kind == ast::NodeKind::Attribute) {
        out = detail::resolveAttributeCall(static_cast<const ast::Attribute&>(*call.callee), *this);
    }
}
