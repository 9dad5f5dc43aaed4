/***
 * Name: test_diagnostics
 * Purpose: Source snippets under diagnostics and color selection.
 */
#include <gtest/gtest.h>
#include "cli/Options.h"
#include "driver/Driver.h"

#include <cstdlib>
#include <string>
#include <vector>

using namespace pyinfer;

TEST(RenderSnippet, SingleLineWithCaret) {
  const std::vector<std::string> lines{"def f(x): return x + y"};
  EXPECT_EQ(Driver::render_snippet(lines, 1, 22, 1),
            "  def f(x): return x + y\n" + std::string(2 + 21, ' ') + "^\n");
}

TEST(RenderSnippet, ContextShowsPrecedingLines) {
  const std::vector<std::string> lines{"a = 1", "b = 2", "c = (", "d"};
  EXPECT_EQ(Driver::render_snippet(lines, 3, 5, 2), "  b = 2\n  c = (\n      ^\n");
  EXPECT_EQ(Driver::render_snippet(lines, 2, 1, 10), "  a = 1\n  b = 2\n  ^\n");
}

TEST(RenderSnippet, ZeroContextStillShowsTheLine) {
  const std::vector<std::string> lines{"x", "y"};
  EXPECT_EQ(Driver::render_snippet(lines, 2, 1, 0), "  y\n  ^\n");
}

TEST(RenderSnippet, OutOfRangeLineIsEmpty) {
  const std::vector<std::string> lines{"x"};
  EXPECT_TRUE(Driver::render_snippet(lines, 0, 1, 1).empty());
  EXPECT_TRUE(Driver::render_snippet(lines, 5, 1, 1).empty());
}

TEST(UseColor, ExplicitModesWin) {
  cli::Options o;
  o.color = cli::ColorMode::Always;
  EXPECT_TRUE(Driver::use_color(o));
  o.color = cli::ColorMode::Never;
  EXPECT_FALSE(Driver::use_color(o));
}

TEST(UseColor, EnvironmentOverrides) {
  ::setenv("PYINFER_COLOR", "YES", 1);
  ::unsetenv("NO_COLOR");
  EXPECT_TRUE(Driver::use_env_color());
  ::setenv("NO_COLOR", "1", 1);
  EXPECT_FALSE(Driver::use_env_color());
  cli::Options o;
  EXPECT_FALSE(Driver::use_color(o));
  ::unsetenv("NO_COLOR");
  ::setenv("PYINFER_COLOR", "0", 1);
  EXPECT_FALSE(Driver::use_env_color());
  ::unsetenv("PYINFER_COLOR");
}
