#pragma once
#include <string>
#include "ast/Literal.h"

namespace pyinfer::ast {
    // Decoded contents (quotes and prefixes removed, escapes applied)
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
}
