/***
 * Name: ExpressionTyper::visit(remaining expressions)
 * Purpose: Conditional expressions, lambdas, walrus, starred, slices, yield, await.
 */
#include "sema/detail/ExpressionTyper.h"
#include "sema/Unify.h"

#include <string>

using namespace pyinfer;
using namespace pyinfer::sema;

void ExpressionTyper::visit(const ast::IfExpr& ifExpr) {
    out = types::kAny;
    if (!ifExpr.body || !ifExpr.orelse) return;
    out = Unify({infer(*ifExpr.body), infer(*ifExpr.orelse)});
}

void ExpressionTyper::visit(const ast::LambdaExpr& lambda) {
    LocalTypes scope = locals ? *locals : LocalTypes{};
    for (const auto& p : lambda.params) { scope[p.name] = types::kAny; }
    const auto result = lambda.body ? InferType(*lambda.body, *table, &scope) : TypeDescriptor{types::kAny};
    out = "Callable[..., " + (result.empty() ? std::string(types::kAny) : result) + "]";
}

void ExpressionTyper::visit(const ast::NamedExpr& named) {
    out = named.value ? infer(*named.value) : TypeDescriptor{types::kAny};
}

void ExpressionTyper::visit(const ast::Starred&) { out = types::kAny; }
void ExpressionTyper::visit(const ast::Slice&) { out = types::kSlice; }
void ExpressionTyper::visit(const ast::YieldExpr&) { out = types::kAny; }
void ExpressionTyper::visit(const ast::AwaitExpr&) { out = types::kAny; }
