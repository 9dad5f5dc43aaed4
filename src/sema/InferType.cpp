/***
 * Name: pyinfer::sema::InferType
 * Purpose: Entry point for expression inference; routes through ExpressionTyper.
 */
#include "sema/TypeInference.h"
#include "ast/Visitor.h"
#include "sema/detail/ExpressionTyper.h"

namespace pyinfer::sema {

TypeDescriptor InferType(const ast::Expr& expr, const SymbolTable& table, const LocalTypes* locals) {
    ExpressionTyper typer{table, locals};
    ast::dispatch(expr, typer);
    return typer.out;
}

TypeDescriptor ExpressionTyper::infer(const ast::Expr& expr) const {
    ExpressionTyper child{*table, locals};
    ast::dispatch(expr, child);
    return child.out;
}

} // namespace pyinfer::sema
