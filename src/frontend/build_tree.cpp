/***
 * Name: pyinfer::frontend::BuildTree
 * Purpose: Lex, parse and number one module; convert parse errors to SyntaxFailure.
 */
#include "frontend/TreeBuilder.h"
#include "ast/GeometrySummary.h"
#include "lexer/Lexer.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "pyinfer/exceptions/parse_error.h"

#include <cstdint>
#include <memory>
#include <string>

namespace pyinfer::frontend {

bool BuildTree(const std::string& source, const std::string& name, std::unique_ptr<ast::Module>& out,
               SyntaxFailure& failure, obs::Metrics* metrics) {
  out.reset();
  try {
    lex::Lexer lexer; // NOLINT(misc-const-correctness)
    lexer.pushString(source, name);
    if (metrics) { metrics->start("Lex"); }
    (void)lexer.peek(); // scans the whole buffer
    if (metrics) {
      metrics->stop("Lex");
      metrics->setCounter("lex.tokens", static_cast<uint64_t>(lexer.tokens().size()));
      metrics->start("Parse");
    }
    parse::Parser parser(lexer);
    auto mod = parser.parseModule();
    if (metrics) { metrics->stop("Parse"); }
    const int count = ast::NumberNodes(*mod);
    if (metrics) {
      const auto geom = ast::ComputeGeometry(*mod);
      metrics->setAstGeometry({geom.nodes, geom.maxDepth});
      metrics->setCounter("ast.nodes", static_cast<uint64_t>(count));
    }
    out = std::move(mod);
    return true;
  } catch (const exceptions::ParseError& ex) {
    failure.message = ex.what();
    failure.line = ex.line();
    failure.col = ex.col();
    return false;
  }
}

}  // namespace pyinfer::frontend
