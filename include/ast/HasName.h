/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once
#include <string>

namespace pyinfer::ast {
struct HasName {
    std::string name;
};
}
