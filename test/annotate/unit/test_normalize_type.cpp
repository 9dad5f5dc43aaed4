/***
 * Name: test_normalize_type
 * Purpose: Clean-up rules applied to every synthesized annotation.
 */
#include <gtest/gtest.h>
#include "annotate/Annotator.h"

using pyinfer::annotate::NormalizeType;

TEST(NormalizeType, UninformativeInputsBecomeAny) {
  EXPECT_EQ(NormalizeType(""), "Any");
  EXPECT_EQ(NormalizeType("   "), "Any");
  EXPECT_EQ(NormalizeType("unknown"), "Any");
  EXPECT_EQ(NormalizeType("deferred(build)"), "Any");
  EXPECT_EQ(NormalizeType("list[deferred(x)]"), "Any");
}

TEST(NormalizeType, RuntimeNamesAreMappedToTypingNames) {
  EXPECT_EQ(NormalizeType("NoneType"), "None");
  EXPECT_EQ(NormalizeType("TextIOWrapper"), "TextIO");
  EXPECT_EQ(NormalizeType("generator"), "Generator");
  EXPECT_EQ(NormalizeType("list[NoneType] | generator"), "list[None] | Generator");
}

TEST(NormalizeType, OnlyWholeIdentifiersAreReplaced) {
  EXPECT_EQ(NormalizeType("MyNoneTypeX"), "MyNoneTypeX");
  EXPECT_EQ(NormalizeType("generator_factory"), "generator_factory");
}

TEST(NormalizeType, OtherTypesPassThroughTrimmed) {
  EXPECT_EQ(NormalizeType("  dict[str, int] "), "dict[str, int]");
  EXPECT_EQ(NormalizeType("Car | None"), "Car | None");
}
