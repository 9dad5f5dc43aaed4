/***
 * Name: ExpressionTyper::visit(operators)
 * Purpose: Binary, unary, comparison and boolean operator result types.
 */
#include "sema/detail/ExpressionTyper.h"
#include "sema/detail/exptyper/BinaryHandlers.h"

using namespace pyinfer;
using namespace pyinfer::sema;

void ExpressionTyper::visit(const ast::Binary& binary) {
    const auto lhs = binary.lhs ? infer(*binary.lhs) : TypeDescriptor{types::kAny};
    const auto rhs = binary.rhs ? infer(*binary.rhs) : TypeDescriptor{types::kAny};
    out = detail::isBitwise(binary.op) ? detail::handleBinaryBitwise(binary.op, lhs, rhs)
                                       : detail::handleBinaryArithmetic(binary.op, lhs, rhs);
}

void ExpressionTyper::visit(const ast::Unary& unary) {
    switch (unary.op) {
        case ast::UnaryOperator::Not: out = types::kBool; return;
        case ast::UnaryOperator::BitNot: out = types::kInt; return;
        case ast::UnaryOperator::Neg:
        case ast::UnaryOperator::Pos:
            out = unary.operand ? infer(*unary.operand) : TypeDescriptor{types::kAny};
            return;
    }
}

void ExpressionTyper::visit(const ast::Compare&) { out = types::kBool; }

void ExpressionTyper::visit(const ast::BoolOp&) { out = types::kBool; }
