#pragma once
#include <string>
#include "ast/Literal.h"

namespace pyinfer::ast {
    using FloatLiteral = Literal<std::string, NodeKind::FloatLiteral>;
}
