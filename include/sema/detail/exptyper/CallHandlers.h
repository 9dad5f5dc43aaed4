/***
 * @file
 * @brief Call typing: builtins, user functions/classes and method calls.
 */
#pragma once

#include <string>
#include "ast/Attribute.h"
#include "ast/Call.h"
#include "sema/SymbolTable.h"
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema { class ExpressionTyper; }

namespace pyinfer::sema::detail {

    // True when `name` is a builtin with a known return; out receives the refined type.
    bool handleBuiltinCall(const ast::Call& call, const std::string& name, const ExpressionTyper& typer,
                           TypeDescriptor& out);

    // Class constructor, known function return, capitalized name, or deferred(name).
    TypeDescriptor resolveNamedCall(const std::string& name, const SymbolTable& table);

    // obj.method(...) via the method table; deferred(method) when unknown.
    TypeDescriptor resolveAttributeCall(const ast::Attribute& callee, const ExpressionTyper& typer);

} // namespace pyinfer::sema::detail
