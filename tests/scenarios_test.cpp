#include <gtest/gtest.h>

#include <vector>

#include "again.h"
#include "deal.h"
#include "evaluators.h"
#include "test_helpers.h"

namespace rollr {
namespace {

TEST(ScenariosTest, HighestOfThreeDice) {
  Counts<Outcome> highest_die = sum_evaluator()->evaluate(
      source_expression(make_pool(standard_die(6), 3)->highest(1)));
  EXPECT_EQ(highest_die.denominator(), Weight(216));
  EXPECT_EQ(highest_die[6], Weight(91));
  EXPECT_EQ(highest_die[1], Weight(1));
}

TEST(ScenariosTest, FourDiceDropLowest) {
  Counts<Outcome> stats = sum_evaluator()->evaluate(
      source_expression(make_pool(standard_die(6), 4)->highest(3)));
  EXPECT_EQ(stats.denominator(), Weight(1296));
  EXPECT_EQ(stats[18], Weight(21));
  EXPECT_EQ(stats[3], Weight(1));
  EXPECT_NEAR(die_mean(stats), 15869.0 / 1296.0, 1e-12);
}

TEST(ScenariosTest, RiskThreeAttackersAgainstTwoDefenders) {
  ExpressionPtr attack =
      source_expression(make_pool(standard_die(6), 3)->highest(2));
  ExpressionPtr defend = source_expression(make_pool(standard_die(6), 2));
  CompairScores attacker_wins;
  attacker_wins.left = 1;
  Counts<std::int64_t> wins =
      compair_evaluator(attacker_wins)->evaluate({attack, defend});
  EXPECT_EQ(wins, Counts<std::int64_t>::from_pairs(
                      {{0, 2275}, {1, 2611}, {2, 2890}}));
}

TEST(ScenariosTest, StraightInPokerHand) {
  std::vector<Outcome> ranks;
  for (Outcome r = 1; r <= 13; ++r) {
    ranks.push_back(r);
  }
  DealPtr deal = make_deal(make_deck(ranks, 4), 5);
  Counts<Outcome> straights =
      largest_straight_evaluator()->evaluate(source_expression(deal));
  EXPECT_EQ(straights.denominator(), Weight(2598960));
  EXPECT_EQ(straights[5], Weight(9216));
}

TEST(ScenariosTest, FourOfAKindInPokerHand) {
  std::vector<Outcome> ranks;
  for (Outcome r = 1; r <= 13; ++r) {
    ranks.push_back(r);
  }
  DealPtr deal = make_deal(make_deck(ranks, 4), 5);
  Counts<Outcome> groups =
      largest_count_evaluator()->evaluate(source_expression(deal));
  EXPECT_EQ(groups[4], Weight(624));
  EXPECT_EQ(groups[1], Weight(1317888));
}

TEST(ScenariosTest, ExplodingDieReachesEighteen) {
  Die exploded = explode(standard_die(6), {}, 2);
  EXPECT_EQ(exploded.denominator(), Weight(216));
  EXPECT_EQ(exploded[18], Weight(1));
}

TEST(ScenariosTest, MultisetArithmeticOnLiterals) {
  ExpressionPtr a = testing_helpers::literal({1, 2, 2, 3});
  ExpressionPtr b = testing_helpers::literal({1, 2, 4});
  EXPECT_EQ(testing_helpers::expand_certain(multiset_union({a, b})),
            (std::vector<Outcome>{1, 2, 2, 3, 4}));
  EXPECT_EQ(testing_helpers::expand_certain(multiset_intersection({a, b})),
            (std::vector<Outcome>{1, 2}));
  EXPECT_EQ(testing_helpers::expand_certain(multiset_difference({a, b})),
            (std::vector<Outcome>{2, 3}));
  EXPECT_EQ(
      testing_helpers::expand_certain(multiset_symmetric_difference(a, b)),
      (std::vector<Outcome>{2, 3, 4}));
}

} // namespace
} // namespace rollr
