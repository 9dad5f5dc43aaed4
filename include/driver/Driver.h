#ifndef PYINFER_DRIVER_DRIVER_H
#define PYINFER_DRIVER_DRIVER_H

/***
 * Name: pyinfer::Driver
 * Purpose: Run one analysis or annotation from the command line.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Report on stdout, diagnostics on stderr, optional log files; exit code
 * Theory of Operation:
 *   Reads the single input file and the optional suggestions file, runs the
 *   Analyzer with a Metrics sink, prints undeclared names as warnings (or a
 *   syntax/analysis failure as an error), then writes the requested report:
 *   a symbol summary, JSON, a node/edge graph or annotated source. Exit code
 *   0 on success, 1 when the input could not be analyzed.
 */

#include <string>
#include <vector>

// Forward declarations to reduce header coupling
namespace pyinfer { namespace cli { struct Options; } }
namespace pyinfer { namespace sema { struct Diagnostic; } }

namespace pyinfer {
    enum class Severity { Warning, Error };

    class Driver {
    public:
        static int run(const cli::Options &opts);

        static bool use_env_color();

        static bool use_color(const cli::Options &opts);

        static void print_diagnostic(const sema::Diagnostic &diag, Severity severity, bool color, int context);

        // Numbered source lines [line - context + 1, line] followed by a caret under col (1-based).
        static std::string render_snippet(const std::vector<std::string> &lines, int line, int col, int context);
    };
} // namespace pyinfer

#endif // PYINFER_DRIVER_DRIVER_H
