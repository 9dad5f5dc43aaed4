#pragma once

#include <string>

namespace pyinfer::cli {

    // Help text printed for -h/--help and after argument errors.
    std::string Usage();

} // namespace pyinfer::cli
