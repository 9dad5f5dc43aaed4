#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"

namespace pyinfer::cli {

    struct Options {
        bool showHelp{false};
        bool annotate{false};         // --annotate
        bool json{false};             // --json
        bool graph{false};            // --graph
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool enclosingParams{false};  // --closure-params
        std::string outputFile{};     // -o <file>; stdout when empty
        std::string suggestionsPath{}; // --suggestions=<file.json>
        std::vector<std::string> inputs{};
        ColorMode color{ColorMode::Auto};
        int diagContext{1};
        bool astLog{false};           // --ast-log (stdout)
        std::string logPath{"."};     // --log-path=<dir> (defaults to ./)
        bool logLexer{false};         // --log-lexer
        bool logAst{false};           // --log-ast (file logging; not to stdout)
    };

} // namespace pyinfer::cli
