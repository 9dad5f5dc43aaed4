/***
 * Name: pyinfer::sema::SymbolTableBuilder (implicit bindings)
 * Purpose: Names bound by loops, 'with'/'except' targets, walrus, lambdas,
 *          comprehensions and global/nonlocal statements.
 */
#include "sema/SymbolTableBuilder.h"

namespace pyinfer::sema {

void SymbolTableBuilder::bindImplicit(const ast::Expr& target) {
    switch (target.kind) {
        case ast::NodeKind::Name:
            table_.implicitBindings.insert(static_cast<const ast::Name&>(target).id);
            return;
        case ast::NodeKind::TupleLiteral:
            for (const auto& e : static_cast<const ast::TupleLiteral&>(target).elements) bindImplicit(*e);
            return;
        case ast::NodeKind::ListLiteral:
            for (const auto& e : static_cast<const ast::ListLiteral&>(target).elements) bindImplicit(*e);
            return;
        case ast::NodeKind::Starred: {
            const auto& st = static_cast<const ast::Starred&>(target);
            if (st.value) bindImplicit(*st.value);
            return;
        }
        default:
            return; // attribute/subscript targets bind nothing
    }
}

void SymbolTableBuilder::bindComprehension(const std::vector<ast::ComprehensionFor>& fors) {
    for (const auto& clause : fors) {
        if (clause.target) bindImplicit(*clause.target);
    }
}

void SymbolTableBuilder::visit(const ast::ForStmt& loop) {
    if (loop.target) bindImplicit(*loop.target);
    visitChildren(loop);
}

void SymbolTableBuilder::visit(const ast::WithStmt& with) {
    for (const auto& item : with.items) {
        if (item.optionalVars) bindImplicit(*item.optionalVars);
    }
    visitChildren(with);
}

void SymbolTableBuilder::visit(const ast::ExceptHandler& handler) {
    if (!handler.name.empty()) table_.implicitBindings.insert(handler.name);
    visitChildren(handler);
}

void SymbolTableBuilder::visit(const ast::NamedExpr& named) {
    if (named.target) table_.implicitBindings.insert(named.target->id);
    visitChildren(named);
}

void SymbolTableBuilder::visit(const ast::LambdaExpr& lambda) {
    for (const auto& p : lambda.params) { table_.implicitBindings.insert(p.name); }
    visitChildren(lambda);
}

void SymbolTableBuilder::visit(const ast::ListComp& comp) { bindComprehension(comp.fors); visitChildren(comp); }
void SymbolTableBuilder::visit(const ast::SetComp& comp) { bindComprehension(comp.fors); visitChildren(comp); }
void SymbolTableBuilder::visit(const ast::DictComp& comp) { bindComprehension(comp.fors); visitChildren(comp); }
void SymbolTableBuilder::visit(const ast::GeneratorExpr& comp) { bindComprehension(comp.fors); visitChildren(comp); }

void SymbolTableBuilder::visit(const ast::GlobalStmt& stmt) {
    for (const auto& n : stmt.names) { table_.implicitBindings.insert(n); }
}

void SymbolTableBuilder::visit(const ast::NonlocalStmt& stmt) {
    for (const auto& n : stmt.names) { table_.implicitBindings.insert(n); }
}

} // namespace pyinfer::sema
