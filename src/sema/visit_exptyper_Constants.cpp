/***
 * Name: ExpressionTyper::visit(constants)
 * Purpose: Map each literal kind to its primitive descriptor.
 */
#include "sema/detail/ExpressionTyper.h"

using namespace pyinfer;
using namespace pyinfer::sema;

void ExpressionTyper::visit(const ast::IntLiteral&) { out = types::kInt; }
void ExpressionTyper::visit(const ast::FloatLiteral&) { out = types::kFloat; }
void ExpressionTyper::visit(const ast::ImagLiteral&) { out = types::kComplex; }
void ExpressionTyper::visit(const ast::StringLiteral&) { out = types::kStr; }
void ExpressionTyper::visit(const ast::BytesLiteral&) { out = types::kBytes; }
void ExpressionTyper::visit(const ast::BoolLiteral&) { out = types::kBool; }
void ExpressionTyper::visit(const ast::NoneLiteral&) { out = types::kNone; }
void ExpressionTyper::visit(const ast::EllipsisLiteral&) { out = types::kAny; }
void ExpressionTyper::visit(const ast::FStringLiteral&) { out = types::kStr; }
