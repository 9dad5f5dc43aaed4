/***
 * @file
 * @brief Projection of attribute and subscript access onto a base type.
 */
#pragma once

#include <string>
#include "ast/Expr.h"
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema::detail {

    // module is the imported module name when the base is an import, else empty.
    TypeDescriptor projectAttribute(const TypeDescriptor& base, const std::string& module, const std::string& attr);

    TypeDescriptor projectSubscript(const TypeDescriptor& base, const ast::Expr& index);

} // namespace pyinfer::sema::detail
