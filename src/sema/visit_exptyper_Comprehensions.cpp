/***
 * Name: ExpressionTyper::visit(comprehensions)
 * Purpose: Type the element expression with comprehension targets bound to
 *          the element type of what they iterate, then wrap it.
 */
#include "sema/detail/ExpressionTyper.h"
#include "ast/Visitor.h"

#include <cstddef>
#include <string>
#include <vector>

using namespace pyinfer;
using namespace pyinfer::sema;

namespace {
void bindTarget(const ast::Expr& target, const TypeDescriptor& type, LocalTypes& scope) {
    if (target.kind == ast::NodeKind::Name) {
        scope[static_cast<const ast::Name&>(target).id] = type;
        return;
    }
    const std::vector<std::unique_ptr<ast::Expr>>* parts = nullptr;
    if (target.kind == ast::NodeKind::TupleLiteral) parts = &static_cast<const ast::TupleLiteral&>(target).elements;
    if (target.kind == ast::NodeKind::ListLiteral) parts = &static_cast<const ast::ListLiteral&>(target).elements;
    if (target.kind == ast::NodeKind::Starred) {
        const auto& st = static_cast<const ast::Starred&>(target);
        if (st.value) bindTarget(*st.value, types::kList, scope);
        return;
    }
    if (parts == nullptr) return;
    // Unpack position by position only for an exact tuple of the same arity
    std::string head;
    std::vector<TypeDescriptor> args;
    const bool exact = SplitGeneric(type, head, args) && head == types::kTuple && args.size() == parts->size() &&
                       !(args.size() == 2 && args[1] == "...");
    for (std::size_t i = 0; i < parts->size(); ++i) {
        bindTarget(*(*parts)[i], exact ? args[i] : TypeDescriptor{types::kAny}, scope);
    }
}

std::string wrap(const char* head, const TypeDescriptor& elem) {
    if (IsAny(elem)) return head;
    return std::string(head) + "[" + elem + "]";
}
} // namespace

LocalTypes ExpressionTyper::bindComprehensionTargets(const std::vector<ast::ComprehensionFor>& fors) const {
    LocalTypes scope = locals ? *locals : LocalTypes{};
    for (const auto& clause : fors) {
        if (!clause.iter || !clause.target) continue;
        ExpressionTyper iterTyper{*table, &scope};
        ast::dispatch(*clause.iter, iterTyper);
        bindTarget(*clause.target, ElementType(iterTyper.out), scope);
    }
    return scope;
}

void ExpressionTyper::visit(const ast::ListComp& comp) {
    const auto scope = bindComprehensionTargets(comp.fors);
    out = comp.elt ? wrap(types::kList, InferType(*comp.elt, *table, &scope)) : std::string(types::kList);
}

void ExpressionTyper::visit(const ast::SetComp& comp) {
    const auto scope = bindComprehensionTargets(comp.fors);
    out = comp.elt ? wrap(types::kSet, InferType(*comp.elt, *table, &scope)) : std::string(types::kSet);
}

void ExpressionTyper::visit(const ast::DictComp& comp) {
    const auto scope = bindComprehensionTargets(comp.fors);
    out = types::kDict;
    if (!comp.key || !comp.value) return;
    const auto k = InferType(*comp.key, *table, &scope);
    const auto v = InferType(*comp.value, *table, &scope);
    if (!IsAny(k) && !IsAny(v)) out = std::string(types::kDict) + "[" + k + ", " + v + "]";
}

void ExpressionTyper::visit(const ast::GeneratorExpr&) { out = types::kGenerator; }
