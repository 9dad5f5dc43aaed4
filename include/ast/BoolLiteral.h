#pragma once
#include "ast/Literal.h"

namespace pyinfer::ast {
    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;
}
