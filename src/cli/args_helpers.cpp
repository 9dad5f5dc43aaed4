/**
 * @file
 * @brief Small predicates and converters shared by ParseArgs.
 */
#include "cli/ParseArgsInternals.h"

namespace pyinfer::cli::detail {

bool isFlag(const std::string_view arg, const std::string_view flag) { return arg == flag; }

// A lone "-" is not an option; it is rejected later as an unreadable path.
bool isUnknownOptionArg(const std::string_view arg) { return arg.size() > 1 && arg[0] == '-'; }

ColorMode parseColorValue(const std::string_view value) {
    using enum pyinfer::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

void collectRemainingAsInputs(const std::size_t startIndex, const int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

// Consumes the file name following -o; false when it is missing.
bool handleOutputFileFlag(int& idx, const int argc, char** argv, Options& out) {
    if (idx + 1 >= argc) { return false; }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    out.outputFile = argv[++idx];
    return !out.outputFile.empty();
}

} // namespace pyinfer::cli::detail
