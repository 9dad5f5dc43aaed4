#include "cli/ParseArgsInternals.h"

namespace pyinfer::cli::detail {
    /***
     * Name: pyinfer::cli::detail::hasConflictingModes
     * Purpose: JSON and annotated source cannot share stdout.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.json && opts.annotate && opts.outputFile.empty();
    }
} // namespace pyinfer::cli::detail
