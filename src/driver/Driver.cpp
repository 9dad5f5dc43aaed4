/***
 * Name: pyinfer::Driver::run
 * Purpose: Execute one command-line analysis end-to-end.
 */
#include "driver/Driver.h"
#include "analyzer/Analyzer.h"
#include "cli/Options.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "pyinfer/exceptions/config_error.h"
#include "pyinfer/exceptions/file_read_error.h"
#include "pyinfer/exceptions/parse_error.h"
#include "pyinfer/support/fs.h"
#include "report/AstGraph.h"
#include "report/JsonReport.h"
#include "report/SuggestionsReader.h"
#include "sema/Diagnostic.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace pyinfer {

namespace {

std::string read_or_throw(const std::string& path) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
  return text;
}

std::string timestamp_prefix() {
  const auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

// Empty when the directory cannot be created; file logging is then skipped.
std::string prepare_log_dir(const std::string& logPath) {
  const std::string logDir = logPath.empty() ? std::string(".") : logPath;
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (!fs::exists(logDir, errCode) && !fs::create_directories(logDir, errCode) && !fs::exists(logDir, errCode)) {
    std::cerr << "pyinfer: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
    return {};
  }
  return logDir;
}

void write_log(const std::string& logDir, const std::string& fileName, const std::string& text) {
  std::ofstream out(logDir + "/" + fileName);
  if (!out) {
    std::cerr << "pyinfer: cannot write log '" << logDir << "/" << fileName << "'\n";
    return;
  }
  out << text;
}

void log_tokens(const std::string& source, const std::string& input, const std::string& logDir,
                const std::string& tsPrefix) {
  lex::Lexer lexer; // NOLINT(misc-const-correctness)
  lexer.pushString(source, input);
  try {
    write_log(logDir, tsPrefix + "lexer.tokens.log", lexer.renderTokenLog());
  } catch (const exceptions::ParseError& ex) {
    // The analysis reports the same error with its position.
    write_log(logDir, tsPrefix + "lexer.tokens.log", std::string("lexer error: ") + ex.what() + "\n");
  }
}

void report_failure(const std::string& input, const std::string& error,
                    const std::optional<frontend::SyntaxFailure>& failure, const cli::Options& opts) {
  sema::Diagnostic diag;
  diag.file = input;
  diag.message = error;
  if (failure) {
    diag.line = failure->line;
    diag.col = failure->col;
  }
  Driver::print_diagnostic(diag, Severity::Error, Driver::use_color(opts), opts.diagContext);
}

void report_undeclared(const std::string& input, const AnalysisResult& result, const cli::Options& opts) {
  const bool color = Driver::use_color(opts);
  for (const auto& ref : result.undeclared) {
    sema::Diagnostic diag;
    diag.file = input;
    diag.line = ref.line;
    diag.col = ref.col + 1;
    diag.message = "undeclared name '" + ref.name + "'";
    if (ref.function) { diag.message += " in function '" + *ref.function + "'"; }
    Driver::print_diagnostic(diag, Severity::Warning, color, opts.diagContext);
  }
}

void print_symbol_summary(const sema::SymbolTable& table) {
  for (const auto& [name, fn] : table.functions) {
    std::cout << "function " << name << "(";
    bool first = true;
    for (const auto& p : fn.params) {
      std::cout << (first ? "" : ", ") << p.name;
      first = false;
    }
    std::cout << ") -> " << fn.returnAnnotation.value_or(fn.inferredReturn.value_or("?")) << "  @" << fn.line << "\n";
  }
  for (const auto& [name, cls] : table.classes) {
    std::cout << "class " << name << " methods=" << cls.methods.size() << "  @" << cls.line << "\n";
  }
  for (const auto& [name, var] : table.variables) {
    std::cout << "variable " << name << ": " << var.annotation.value_or(var.inferredType.value_or("?")) << "  @"
              << var.line << "\n";
  }
  for (const auto& [name, imp] : table.imports) {
    std::cout << "import " << name << " from " << imp.module << "  @" << imp.line << "\n";
  }
}

void emit_metrics(const obs::Metrics& metrics, const cli::Options& opts, const std::string& logDir,
                  const std::string& tsPrefix) {
  if (opts.metricsJson) {
    std::cout << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cout << metrics.summaryText();
  }
  if ((opts.metrics || opts.metricsJson) && !logDir.empty()) {
    write_log(logDir, tsPrefix + "metrics.json", metrics.summaryJson());
  }
}

int run_annotate(const std::string& input, const std::string& source, const annotate::Suggestions* suggestions,
                 const Analyzer& analyzer, const cli::Options& opts) {
  const auto result = analyzer.annotate(source, input, suggestions);
  if (opts.json) { std::cout << report::AnnotationToJson(result).dump(2) << "\n"; }
  if (!result.success) {
    report_failure(input, result.error, result.failure, opts);
    return 1;
  }
  if (opts.outputFile.empty()) {
    std::cout << result.annotatedText;
    return 0;
  }
  std::string err;
  if (!support::WriteFile(opts.outputFile, result.annotatedText, err)) {
    throw exceptions::FileReadError(err);
  }
  return 0;
}

int run_analyze(const std::string& input, const std::string& source, const Analyzer& analyzer,
                const cli::Options& opts, const std::string& logDir, const std::string& tsPrefix) {
  const auto result = analyzer.analyze(source, input);
  if (opts.json) { std::cout << report::AnalysisToJson(result).dump(2) << "\n"; }
  if (!result.success) {
    report_failure(input, result.error, result.failure, opts);
    return 1;
  }
  if (opts.astLog || (opts.logAst && !logDir.empty())) {
    obs::AstPrinter printer; // NOLINT(misc-const-correctness)
    const auto out = printer.print(*result.module);
    if (opts.astLog) { std::cout << "== AST ==\n" << out; }
    if (opts.logAst && !logDir.empty()) { write_log(logDir, tsPrefix + "ast.log", out); }
  }
  if (opts.graph) { std::cout << report::AstGraph(*result.module).dump(2) << "\n"; }
  if (!opts.json && !opts.graph) { print_symbol_summary(*result.symbols); }
  report_undeclared(input, result, opts);
  return 0;
}

} // namespace

int Driver::run(const cli::Options& opts) {
  if (opts.inputs.size() != 1) {
    throw exceptions::ConfigError(opts.inputs.empty() ? "no input file provided" : "expected exactly one input file");
  }
  const std::string& input = opts.inputs.front();
  const std::string source = read_or_throw(input);

  std::optional<annotate::Suggestions> suggestions;
  if (!opts.suggestionsPath.empty()) { suggestions = report::ReadSuggestions(read_or_throw(opts.suggestionsPath)); }

  const bool wantsLogs = opts.logLexer || opts.logAst || opts.metrics || opts.metricsJson;
  const std::string logDir = wantsLogs ? prepare_log_dir(opts.logPath) : std::string{};
  const std::string tsPrefix = timestamp_prefix();
  if (opts.logLexer && !logDir.empty()) { log_tokens(source, input, logDir, tsPrefix); }

  obs::Metrics metrics;
  const Analyzer analyzer(AnalyzerOptions{opts.enclosingParams}, &metrics);
  const int status = opts.annotate
      ? run_annotate(input, source, suggestions ? &*suggestions : nullptr, analyzer, opts)
      : run_analyze(input, source, analyzer, opts, logDir, tsPrefix);
  emit_metrics(metrics, opts, logDir, tsPrefix);
  return status;
}

} // namespace pyinfer
