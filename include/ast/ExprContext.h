#pragma once

namespace pyinfer::ast {
    // How a name/attribute/subscript is used at its position in the tree
    enum class ExprContext { Load, Store, Del };

    const char* to_string(ExprContext ctx);
}
