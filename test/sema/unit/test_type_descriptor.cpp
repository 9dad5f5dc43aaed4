/***
 * Name: test_type_descriptor
 * Purpose: Descriptor text helpers (placeholders, splitting, element types).
 */
#include <gtest/gtest.h>
#include "sema/TypeDescriptor.h"

#include <string>
#include <vector>

using namespace pyinfer::sema;

TEST(TypeDescriptor, DeferredPlaceholders) {
  const auto d = MakeDeferred("build");
  EXPECT_EQ(d, "deferred(build)");
  EXPECT_TRUE(IsDeferred(d));
  EXPECT_EQ(DeferredTarget(d), "build");
  EXPECT_FALSE(IsDeferred("int"));
  EXPECT_TRUE(DeferredTarget("int").empty());
}

TEST(TypeDescriptor, SplitTopLevelRespectsBrackets) {
  const auto parts = SplitTopLevel("dict[str, int], list[tuple[int, str]]", ",");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "dict[str, int]");
  EXPECT_EQ(parts[1], "list[tuple[int, str]]");
}

TEST(TypeDescriptor, GenericsAndBaseNames) {
  std::string head;
  std::vector<TypeDescriptor> args;
  ASSERT_TRUE(SplitGeneric("dict[str, list[int]]", head, args));
  EXPECT_EQ(head, "dict");
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(args[1], "list[int]");
  EXPECT_FALSE(SplitGeneric("int", head, args));
  EXPECT_EQ(BaseName("set[str]"), "set");
  EXPECT_EQ(BaseName("int"), "int");
}

TEST(TypeDescriptor, UnionMembers) {
  const auto members = UnionMembers("int | list[str | None] | None");
  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[1], "list[str | None]");
}

TEST(TypeDescriptor, ElementTypes) {
  EXPECT_EQ(ElementType("list[int]"), "int");
  EXPECT_EQ(ElementType("str"), "str");
  EXPECT_EQ(ElementType("dict[str, int]"), "str");
  EXPECT_EQ(ElementType("list"), "Any");
}

TEST(TypeDescriptor, Predicates) {
  EXPECT_TRUE(IsAny("Any"));
  EXPECT_FALSE(IsAny("int"));
  EXPECT_TRUE(IsNumeric("int"));
  EXPECT_TRUE(IsNumeric("float"));
  EXPECT_FALSE(IsNumeric("str"));
}
