/**
 * @file
 * @brief handleBinaryArithmetic / handleBinaryBitwise: operator result types.
 */
#include "sema/detail/exptyper/BinaryHandlers.h"

namespace pyinfer::sema::detail {

using ast::BinaryOperator;

namespace {
bool sameContainer(const TypeDescriptor& lhs, const TypeDescriptor& rhs, const char* head) {
    return lhs == rhs && BaseName(lhs) == head;
}
} // namespace

bool isBitwise(const BinaryOperator op) {
    switch (op) {
        case BinaryOperator::BitAnd:
        case BinaryOperator::BitOr:
        case BinaryOperator::BitXor:
        case BinaryOperator::LShift:
        case BinaryOperator::RShift:
            return true;
        default:
            return false;
    }
}

TypeDescriptor handleBinaryArithmetic(const BinaryOperator op, const TypeDescriptor& lhs,
                                      const TypeDescriptor& rhs) {
    const bool lStr = lhs == types::kStr;
    const bool rStr = rhs == types::kStr;
    const bool anyFloat = lhs == types::kFloat || rhs == types::kFloat;
    switch (op) {
        case BinaryOperator::Div:
            return types::kFloat;
        case BinaryOperator::FloorDiv:
            return anyFloat ? types::kFloat : types::kInt;
        case BinaryOperator::Add:
            if (lStr || rStr) return types::kStr;
            if (sameContainer(lhs, rhs, types::kList)) return lhs;
            break;
        case BinaryOperator::Mul:
            if ((lStr && IsNumeric(rhs)) || (rStr && IsNumeric(lhs))) return types::kStr;
            if (BaseName(lhs) == types::kList && rhs == types::kInt) return lhs;
            if (BaseName(rhs) == types::kList && lhs == types::kInt) return rhs;
            break;
        case BinaryOperator::Mod:
            if (lStr) return types::kStr;
            break;
        case BinaryOperator::Sub:
            if (sameContainer(lhs, rhs, types::kSet) || sameContainer(lhs, rhs, types::kDict)) return lhs;
            break;
        default:
            break;
    }
    if (anyFloat) return types::kFloat;
    if (lhs == types::kInt || rhs == types::kInt) return types::kInt;
    return "int | float";
}

TypeDescriptor handleBinaryBitwise(const BinaryOperator op, const TypeDescriptor& lhs, const TypeDescriptor& rhs) {
    const bool setLike = op == BinaryOperator::BitOr || op == BinaryOperator::BitAnd || op == BinaryOperator::BitXor;
    if (setLike && (sameContainer(lhs, rhs, types::kSet) || sameContainer(lhs, rhs, types::kDict))) return lhs;
    return types::kInt;
}

} // namespace pyinfer::sema::detail
