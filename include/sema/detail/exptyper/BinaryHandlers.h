/***
 * @file
 * @brief Result types of binary arithmetic and bitwise operators.
 */
#pragma once

#include "ast/BinaryOperator.h"
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema::detail {

    bool isBitwise(ast::BinaryOperator op);

    TypeDescriptor handleBinaryArithmetic(ast::BinaryOperator op, const TypeDescriptor& lhs,
                                          const TypeDescriptor& rhs);

    TypeDescriptor handleBinaryBitwise(ast::BinaryOperator op, const TypeDescriptor& lhs,
                                       const TypeDescriptor& rhs);

} // namespace pyinfer::sema::detail
