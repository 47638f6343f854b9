#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "again.h"

namespace rollr {
namespace {

TEST(AgainTest, ExplodeOnce) {
  Die exploded = explode(standard_die(6), {}, 1);
  EXPECT_EQ(exploded.denominator(), Weight(36));
  EXPECT_EQ(exploded[1], Weight(6));
  EXPECT_EQ(exploded[6], Weight(0));
  EXPECT_EQ(exploded[7], Weight(1));
  EXPECT_EQ(exploded[12], Weight(1));
}

TEST(AgainTest, ExplodeTwice) {
  Die exploded = explode(standard_die(6), {}, 2);
  EXPECT_EQ(exploded.denominator(), Weight(216));
  EXPECT_EQ(exploded[18], Weight(1));
  EXPECT_EQ(exploded[13], Weight(1));
  EXPECT_EQ(exploded[5], Weight(36));
}

TEST(AgainTest, ExplodeWithoutDepthIsIdentity) {
  EXPECT_EQ(explode(standard_die(6), {}, 0), standard_die(6));
}

TEST(AgainTest, ExplicitTargets) {
  Die exploded = explode(standard_die(4), {1}, 1);
  EXPECT_EQ(exploded, Die::from_pairs({{2, 5},
                                       {3, 5},
                                       {4, 5},
                                       {5, 1}}));
}

TEST(AgainTest, EndBehaviors) {
  std::vector<AgainEntry> entries{Outcome{1}, again_plus(2)};

  AgainEnd reroll{AgainEnd::Kind::Reroll, 0};
  EXPECT_EQ(make_die_with_again(entries, {}, 0, reroll),
            Die::from_pairs({{1, 1}}));

  AgainEnd value{AgainEnd::Kind::Value, 10};
  EXPECT_EQ(make_die_with_again(entries, {}, 0, value),
            Die::from_pairs({{1, 1}, {12, 1}}));

  AgainEnd infinity{AgainEnd::Kind::Infinity, 0};
  EXPECT_EQ(make_die_with_again(entries, {}, 0, infinity),
            Die::from_pairs({{1, 1}, {kAgainInfinity, 1}}));

  EXPECT_EQ(make_die_with_again(entries, {}, 0),
            Die::from_pairs({{1, 1}, {2, 1}}));
}

TEST(AgainTest, PlaceholdersRollIndependently) {
  std::vector<AgainEntry> entries{Outcome{1}, again_add(again(), again())};
  Die die = make_die_with_again(entries, {}, 1);
  EXPECT_EQ(die.denominator(), Weight(8));
  EXPECT_EQ(die[0], Weight(1));
  EXPECT_EQ(die[1], Weight(6));
  EXPECT_EQ(die[2], Weight(1));
}

TEST(AgainTest, RejectsTupleOutcomes) {
  AgainTuple with_again{{Outcome{1}, again()}};
  try {
    make_die_with_again({Outcome{1}, with_again});
    FAIL() << "expected invalid_argument";
  } catch (const std::invalid_argument &e) {
    EXPECT_STREQ(e.what(), "Again is not allowed inside tuple outcomes");
  }
  AgainTuple plain{{Outcome{1}, Outcome{2}}};
  EXPECT_THROW(make_die_with_again({Outcome{1}, plain}),
               std::invalid_argument);
}

TEST(AgainTest, DefaultEndNeedsPlainEntry) {
  EXPECT_THROW(make_die_with_again({again_plus(1)}, {}, 2),
               std::invalid_argument);
}

TEST(AgainTest, SaturatesAtInfinity) {
  std::vector<AgainEntry> entries{Outcome{1}, again_plus(1)};
  AgainEnd infinity{AgainEnd::Kind::Infinity, 0};
  Die die = make_die_with_again(entries, {}, 1, infinity);
  EXPECT_EQ(die[kAgainInfinity], Weight(1));
  EXPECT_EQ(die[2], Weight(1));
  EXPECT_EQ(die[1], Weight(2));
}

} // namespace
} // namespace rollr
