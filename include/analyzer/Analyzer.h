#ifndef PYINFER_ANALYZER_ANALYZER_H
#define PYINFER_ANALYZER_ANALYZER_H

/***
 * Name: pyinfer::Analyzer
 * Purpose: Public entry points: analyze a module, or annotate it.
 * Inputs:
 *   - source text and a display name
 *   - optional Suggestions (annotate only)
 * Outputs:
 *   - AnalysisResult / AnnotationResult
 * Theory of Operation:
 *   BuildTree -> SymbolTableBuilder -> ResolveDeferred -> UndeclaredDetector,
 *   then CollectTypes + AnnotateSource for annotate(). Both calls are total:
 *   a syntax error becomes "SyntaxError: <message>" with its position, any
 *   other exception becomes "AnalysisError: <message>", and a failed result
 *   carries no tree and no symbol table. Every call builds everything anew.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "annotate/Suggestions.h"
#include "annotate/TypeInfo.h"
#include "ast/Module.h"
#include "frontend/TreeBuilder.h"
#include "sema/SymbolTable.h"
#include "sema/UndeclaredDetector.h"

namespace pyinfer { namespace obs { class Metrics; } }

namespace pyinfer {

    struct AnalyzerOptions {
        bool enclosingParameters{false};
    };

    struct AnalysisResult {
        bool success{false};
        std::unique_ptr<ast::Module> module;
        std::unique_ptr<sema::SymbolTable> symbols;
        std::vector<sema::UndeclaredReference> undeclared;
        std::string error;
        std::optional<frontend::SyntaxFailure> failure;
    };

    struct AnnotationResult {
        bool success{false};
        std::string originalText;
        std::string annotatedText;
        annotate::TypeInfo typeInfo;
        std::size_t annotationCount{0};
        std::string error;
        std::optional<frontend::SyntaxFailure> failure;
    };

    class Analyzer {
    public:
        explicit Analyzer(AnalyzerOptions options = {}, obs::Metrics *metrics = nullptr)
            : options_(options), metrics_(metrics) {}

        AnalysisResult analyze(const std::string &source, const std::string &name = "<input>") const;

        AnnotationResult annotate(const std::string &source, const std::string &name = "<input>",
                                  const annotate::Suggestions *suggestions = nullptr) const;

    private:
        AnalyzerOptions options_;
        obs::Metrics *metrics_;
    };

} // namespace pyinfer

#endif // PYINFER_ANALYZER_ANALYZER_H
