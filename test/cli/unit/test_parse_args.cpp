/***
 * Name: test_parse_args
 * Purpose: Command-line flags, prefixed options, positionals and conflicts.
 */
#include <gtest/gtest.h>
#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"

#include <string>
#include <vector>

using namespace pyinfer;

namespace {
// Owns argv storage for one ParseArgs call.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    storage.insert(storage.begin(), "pyinfer");
    for (auto& s : storage) { ptrs.push_back(s.data()); }
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage.size()); }
  char** argv() { return ptrs.data(); }
  std::vector<std::string> storage;
  std::vector<char*> ptrs;
};

bool parse(std::vector<std::string> args, cli::Options& out) {
  Argv a(std::move(args));
  return cli::ParseArgs(a.argc(), a.argv(), out);
}
} // namespace

TEST(ParseArgs, DefaultsWithSingleInput) {
  cli::Options o;
  ASSERT_TRUE(parse({"app.py"}, o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "app.py");
  EXPECT_FALSE(o.annotate);
  EXPECT_FALSE(o.json);
  EXPECT_FALSE(o.enclosingParams);
  EXPECT_EQ(o.color, cli::ColorMode::Auto);
  EXPECT_EQ(o.diagContext, 1);
  EXPECT_EQ(o.logPath, ".");
}

TEST(ParseArgs, BooleanFlags) {
  cli::Options o;
  ASSERT_TRUE(parse({"--annotate", "--graph", "--metrics", "--metrics-json", "--closure-params", "--log-lexer",
                     "--log-ast", "--ast-log", "x.py"},
                    o));
  EXPECT_TRUE(o.annotate);
  EXPECT_TRUE(o.graph);
  EXPECT_TRUE(o.metrics);
  EXPECT_TRUE(o.metricsJson);
  EXPECT_TRUE(o.enclosingParams);
  EXPECT_TRUE(o.logLexer);
  EXPECT_TRUE(o.logAst);
  EXPECT_TRUE(o.astLog);
}

TEST(ParseArgs, HelpFlag) {
  cli::Options o;
  ASSERT_TRUE(parse({"--help"}, o));
  EXPECT_TRUE(o.showHelp);
  cli::Options s;
  ASSERT_TRUE(parse({"-h"}, s));
  EXPECT_TRUE(s.showHelp);
}

TEST(ParseArgs, PrefixedOptions) {
  cli::Options o;
  ASSERT_TRUE(parse({"--suggestions=hints.json", "--log-path=/tmp/logs", "--color=never", "--diag-context=3", "a.py"},
                    o));
  EXPECT_EQ(o.suggestionsPath, "hints.json");
  EXPECT_EQ(o.logPath, "/tmp/logs");
  EXPECT_EQ(o.color, cli::ColorMode::Never);
  EXPECT_EQ(o.diagContext, 3);
}

TEST(ParseArgs, InvalidDiagContextBecomesZero) {
  cli::Options o;
  ASSERT_TRUE(parse({"--diag-context=lots", "a.py"}, o));
  EXPECT_EQ(o.diagContext, 0);
  cli::Options n;
  ASSERT_TRUE(parse({"--diag-context=-4", "a.py"}, n));
  EXPECT_EQ(n.diagContext, 0);
}

TEST(ParseArgs, OutputFile) {
  cli::Options o;
  ASSERT_TRUE(parse({"--annotate", "-o", "out.py", "in.py"}, o));
  EXPECT_EQ(o.outputFile, "out.py");
  EXPECT_EQ(o.inputs, std::vector<std::string>{"in.py"});
  cli::Options missing;
  EXPECT_FALSE(parse({"in.py", "-o"}, missing));
}

TEST(ParseArgs, UnknownOptionFails) {
  cli::Options o;
  EXPECT_FALSE(parse({"--frobnicate", "a.py"}, o));
}

TEST(ParseArgs, DoubleDashEndsOptions) {
  cli::Options o;
  ASSERT_TRUE(parse({"--json", "--", "-weird.py", "--annotate"}, o));
  EXPECT_TRUE(o.json);
  EXPECT_FALSE(o.annotate);
  EXPECT_EQ(o.inputs, (std::vector<std::string>{"-weird.py", "--annotate"}));
}

TEST(ParseArgs, JsonWithAnnotateNeedsOutputFile) {
  cli::Options o;
  EXPECT_FALSE(parse({"--json", "--annotate", "a.py"}, o));
  cli::Options ok;
  EXPECT_TRUE(parse({"--json", "--annotate", "-o", "out.py", "a.py"}, ok));
}

TEST(ParseArgsInternals, ColorValues) {
  EXPECT_EQ(cli::detail::parseColorValue("always"), cli::ColorMode::Always);
  EXPECT_EQ(cli::detail::parseColorValue("never"), cli::ColorMode::Never);
  EXPECT_EQ(cli::detail::parseColorValue("auto"), cli::ColorMode::Auto);
  EXPECT_EQ(cli::detail::parseColorValue("purple"), cli::ColorMode::Auto);
}

TEST(ParseArgsInternals, UnknownOptionShape) {
  EXPECT_TRUE(cli::detail::isUnknownOptionArg("-x"));
  EXPECT_FALSE(cli::detail::isUnknownOptionArg("-"));
  EXPECT_FALSE(cli::detail::isUnknownOptionArg("file.py"));
}
