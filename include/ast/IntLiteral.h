#pragma once
#include <string>
#include "ast/Literal.h"

namespace pyinfer::ast {
    // Integers keep their source spelling; values may exceed any fixed width.
    using IntLiteral = Literal<std::string, NodeKind::IntLiteral>;
}
