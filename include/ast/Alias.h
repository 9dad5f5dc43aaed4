#pragma once
#include <string>

namespace pyinfer::ast {
    // One 'name [as asname]' entry of an import statement
    struct Alias {
        std::string name;
        std::string asname; // empty if none
        int line{0};
        int col{0};
    };
}
