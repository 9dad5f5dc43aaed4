#pragma once
#include <string>
#include <vector>
#include "ast/Alias.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct ImportFrom final : Stmt {
        std::string module; // empty for relative-only
        int level{0};       // number of leading dots
        std::vector<Alias> names;
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
