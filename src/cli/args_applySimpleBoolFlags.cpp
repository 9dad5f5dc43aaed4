#include "cli/ParseArgsInternals.h"

namespace pyinfer::cli::detail {
    /***
     * Name: pyinfer::cli::detail::applySimpleBoolFlags
     * Purpose: Apply flag-only options; returns true when arg was consumed.
     */
    bool applySimpleBoolFlags(const std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--annotate")) {
            out.annotate = true;
            return true;
        }
        if (isFlag(arg, "--json")) {
            out.json = true;
            return true;
        }
        if (isFlag(arg, "--graph")) {
            out.graph = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--closure-params")) {
            out.enclosingParams = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-ast")) {
            out.logAst = true;
            return true;
        }
        if (isFlag(arg, "--ast-log")) {
            out.astLog = true;
            return true;
        }
        return false;
    }
} // namespace pyinfer::cli::detail
