/***
 * Name: pyinfer::Analyzer (impl)
 */
#include "analyzer/Analyzer.h"
#include "annotate/Annotator.h"
#include "observability/Metrics.h"
#include "pyinfer/exceptions/analysis_error.h"
#include "pyinfer/exceptions/parse_error.h"
#include "sema/ResolveDeferred.h"
#include "sema/SymbolTableBuilder.h"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace pyinfer {

namespace {

// Starts a phase timer on construction and stops it on scope exit.
class PhaseTimer {
 public:
  PhaseTimer(obs::Metrics* metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
    if (metrics_) { metrics_->start(name_); }
  }
  ~PhaseTimer() {
    if (metrics_) { metrics_->stop(name_); }
  }
  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;

 private:
  obs::Metrics* metrics_;
  std::string name_;
};

void countSymbols(obs::Metrics* metrics, const sema::SymbolTable& table) {
  if (!metrics) { return; }
  metrics->setCounter("symbols.functions", static_cast<uint64_t>(table.functions.size()));
  metrics->setCounter("symbols.classes", static_cast<uint64_t>(table.classes.size()));
  metrics->setCounter("symbols.variables", static_cast<uint64_t>(table.variables.size()));
  metrics->setCounter("symbols.imports", static_cast<uint64_t>(table.imports.size()));
}

std::string syntaxError(const std::string& message) { return "SyntaxError: " + message; }

std::string analysisError(const std::string& message) { return "AnalysisError: " + message; }

}  // namespace

AnalysisResult Analyzer::analyze(const std::string& source, const std::string& name) const {
  AnalysisResult result;
  try {
    frontend::SyntaxFailure failure;
    if (!frontend::BuildTree(source, name, result.module, failure, metrics_)) {
      result.error = syntaxError(failure.message);
      result.failure = std::move(failure);
      return result;
    }
    if (!result.module) { throw exceptions::AnalysisError("tree builder produced no module"); }
    auto table = std::make_unique<sema::SymbolTable>();
    {
      const PhaseTimer timer(metrics_, "Symbols");
      sema::SymbolTableBuilder builder; // NOLINT(misc-const-correctness)
      *table = builder.build(*result.module);
    }
    {
      const PhaseTimer timer(metrics_, "Resolve");
      const auto rewritten = sema::ResolveDeferred(*table);
      if (metrics_) { metrics_->setCounter("resolve.rewritten", static_cast<uint64_t>(rewritten)); }
    }
    countSymbols(metrics_, *table);
    {
      const PhaseTimer timer(metrics_, "Undeclared");
      sema::UndeclaredDetector detector(*table, sema::UndeclaredOptions{options_.enclosingParameters});
      result.undeclared = detector.detect(*result.module);
    }
    if (metrics_) { metrics_->setCounter("undeclared.count", static_cast<uint64_t>(result.undeclared.size())); }
    result.symbols = std::move(table);
    result.success = true;
  } catch (const exceptions::ParseError& ex) {
    result = AnalysisResult{};
    result.error = syntaxError(ex.what());
    result.failure = frontend::SyntaxFailure{ex.what(), ex.line(), ex.col()};
  } catch (const std::exception& ex) {
    result = AnalysisResult{};
    result.error = analysisError(ex.what());
  }
  return result;
}

AnnotationResult Analyzer::annotate(const std::string& source, const std::string& name,
                                    const annotate::Suggestions* suggestions) const {
  AnnotationResult result;
  result.originalText = source;
  AnalysisResult analysis = analyze(source, name);
  if (!analysis.success) {
    result.error = std::move(analysis.error);
    result.failure = std::move(analysis.failure);
    return result;
  }
  try {
    const PhaseTimer timer(metrics_, "Annotate");
    result.typeInfo = annotate::CollectTypes(*analysis.symbols, suggestions);
    result.annotatedText = annotate::AnnotateSource(source, result.typeInfo);
    result.annotationCount = result.typeInfo.annotationCount();
    result.success = true;
  } catch (const std::exception& ex) {
    result.typeInfo = annotate::TypeInfo{};
    result.annotatedText.clear();
    result.annotationCount = 0;
    result.error = analysisError(ex.what());
    return result;
  }
  if (metrics_) { metrics_->setCounter("annotate.count", static_cast<uint64_t>(result.annotationCount)); }
  return result;
}

}  // namespace pyinfer
