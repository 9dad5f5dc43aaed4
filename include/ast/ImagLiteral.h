#pragma once
#include <string>
#include "ast/Literal.h"

namespace pyinfer::ast {
    using ImagLiteral = Literal<std::string, NodeKind::ImagLiteral>;
}
