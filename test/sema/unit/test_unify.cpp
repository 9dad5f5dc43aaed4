/***
 * Name: test_unify
 * Purpose: Bounded merging of descriptors and deterministic sampling.
 */
#include <gtest/gtest.h>
#include "sema/Unify.h"

#include <cstddef>
#include <vector>

using namespace pyinfer::sema;

TEST(Unify, IdenticalMembersCollapse) {
  EXPECT_EQ(Unify({"int", "int", "int"}), "int");
}

TEST(Unify, AnyPoisonsTheResult) {
  EXPECT_EQ(Unify({"int", "Any"}), "Any");
  EXPECT_EQ(UnionOf({"str", "Any"}), "Any");
}

TEST(Unify, IntWidensIntoFloat) {
  EXPECT_EQ(Unify({"int", "float"}), "float");
  EXPECT_EQ(Unify({"int", "None", "float"}), "float | None");
}

TEST(Unify, NumericWithStringIsAny) {
  EXPECT_EQ(Unify({"int", "str"}), "Any");
}

TEST(Unify, SmallUnionsAreKeptInFirstSeenOrder) {
  EXPECT_EQ(Unify({"str", "None"}), "str | None");
  EXPECT_EQ(Unify({"bool", "str | None", "bool"}), "bool | str | None");
}

TEST(Unify, WideUnionsCollapseToAny) {
  EXPECT_EQ(Unify({"str", "bool", "None", "bytes"}), "Any");
  EXPECT_EQ(UnionOf({"int", "str", "bool", "None"}), "Any");
}

TEST(Unify, UnionOfDoesNotWiden) {
  EXPECT_EQ(UnionOf({"int", "float"}), "int | float");
  EXPECT_EQ(UnionOf({"int", "str"}), "int | str");
}

TEST(SampleIndices, ShortSequencesAreFullyInspected) {
  const auto idx = SampleIndices(4);
  EXPECT_EQ(idx, (std::vector<std::size_t>{0, 1, 2, 3}));
  EXPECT_TRUE(SampleIndices(0).empty());
}

TEST(SampleIndices, LongSequencesAreSpreadEvenly) {
  const auto idx = SampleIndices(100);
  ASSERT_EQ(idx.size(), 10u);
  EXPECT_EQ(idx.front(), 0u);
  EXPECT_EQ(idx.back(), 99u);
  EXPECT_EQ(idx[1], 11u);
  EXPECT_EQ(SampleIndices(100), idx);
}
