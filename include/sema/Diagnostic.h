/***
 * Name: pyinfer::sema::Diagnostic
 * Purpose: Carry a soft finding (undeclared name) with its source location.
 */
#pragma once

#include <string>

namespace pyinfer::sema {
    struct Diagnostic {
        std::string message;
        std::string file;
        int line{0};
        int col{0};
    };
} // namespace pyinfer::sema
