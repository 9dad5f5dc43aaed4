#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pyinfer::cli {

namespace {
constexpr std::string_view kUsageText = R"(pyinfer [options] file

Analyze a Python source file: symbol table, inferred types and undeclared names.

Options:
  -h, --help             Print this help and exit
  --annotate             Print the source rewritten with type annotations
  -o <file>              Write the annotated source into <file> (default: stdout)
  --json                 Print the analysis (or annotation) result as JSON
  --graph                Print the syntax tree as a JSON node/edge graph
  --suggestions=<file>   JSON type hints used where inference has no answer
  --closure-params       Treat enclosing functions' parameters as declared
  --ast-log              Dump the syntax tree to stdout
  --log-path=<dir>       Directory where logs are written (lexer/ast)
  --log-lexer            Enable lexer token log
  --log-ast              Enable syntax tree file log
  --metrics              Print phase timings and counters
  --metrics-json         Print phase timings and counters in JSON
  --color=<mode>         Color diagnostics: always|never|auto (default: auto)
  --diag-context=<N>     Source lines shown above each diagnostic caret (default: 1)
  --                     End of options

Exit status: 0 on success, 1 on a syntax or analysis failure, 2 on usage,
configuration or I/O errors.
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyinfer::cli
