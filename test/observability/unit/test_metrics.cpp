/***
 * Name: test_metrics
 * Purpose: Phase timings, counters and summary rendering.
 */
#include <gtest/gtest.h>
#include "observability/Metrics.h"

#include <string>

using namespace pyinfer;

TEST(Metrics, StopWithoutStartIsIgnored) {
  obs::Metrics m;
  m.stop("Parse");
  EXPECT_TRUE(m.durations().empty());
}

TEST(Metrics, PhasesAccumulate) {
  obs::Metrics m;
  m.start("Symbols");
  m.stop("Symbols");
  m.start("Symbols");
  m.stop("Symbols");
  ASSERT_EQ(m.durations().size(), 1u);
  EXPECT_EQ(m.durations().count("Symbols"), 1u);
}

TEST(Metrics, TextSummaryListsEverything) {
  obs::Metrics m;
  m.start("Lex");
  m.stop("Lex");
  m.setAstGeometry({12, 4});
  m.setCounter("symbols.functions", 2);
  m.incCounter("undeclared.count");
  const auto text = m.summaryText();
  EXPECT_NE(text.find("== Metrics =="), std::string::npos);
  EXPECT_NE(text.find("  Lex: "), std::string::npos);
  EXPECT_NE(text.find("AST: nodes=12, max_depth=4"), std::string::npos);
  EXPECT_NE(text.find("symbols.functions = 2"), std::string::npos);
  EXPECT_NE(text.find("undeclared.count = 1"), std::string::npos);
}

TEST(Metrics, JsonSummaryUsesLowercasePhasesAndHints) {
  obs::Metrics m;
  m.start("Resolve");
  m.stop("Resolve");
  m.setCounter("annotate.count", 3);
  m.setCounter("undeclared.count", 1);
  m.setGauge("source.lines", 40);
  const auto json = m.summaryJson();
  EXPECT_NE(json.find("\"resolve\": "), std::string::npos);
  EXPECT_NE(json.find("\"annotate.count\": 3"), std::string::npos);
  EXPECT_NE(json.find("\"gauges\""), std::string::npos);
  EXPECT_NE(json.find("\"undeclared_names_present\""), std::string::npos);
  EXPECT_NE(json.find("\"annotations_added\""), std::string::npos);
}

TEST(Metrics, HintsReflectCounters) {
  obs::Metrics m;
  EXPECT_TRUE(m.hints().empty());
  m.setCounter("annotate.count", 0);
  ASSERT_EQ(m.hints().size(), 1u);
  EXPECT_EQ(m.hints()[0], "annotations_none");
  m.setAstGeometry({60000, 10});
  EXPECT_EQ(m.hints().back(), "large_tree");
}
