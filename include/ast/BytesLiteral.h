#pragma once
#include <string>
#include "ast/Literal.h"

namespace pyinfer::ast {
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;
}
