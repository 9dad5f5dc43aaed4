#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>

namespace pyinfer::cli {
    /***
     * Name: pyinfer::cli::ParseArgs
     * Purpose: Minimal GCC-like CLI argument parser for pyinfer.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::isFlag(arg, "-o") && !detail::handleOutputFileFlag(i, argc, argv, out)) {
                std::cerr << "pyinfer: missing file name after '-o'\n";
                return false;
            }
            if (detail::isFlag(arg, "-o")) { continue; }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pyinfer: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "pyinfer: --json with --annotate needs -o <file> for the annotated source\n";
            return false;
        }

        return true;
    }
} // namespace pyinfer::cli
