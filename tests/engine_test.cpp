#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <vector>

#include "errors.h"
#include "evaluators.h"
#include "test_helpers.h"

namespace rollr {
namespace {

using testing_helpers::enumerate_rolls;

Outcome top_two(const std::vector<Outcome> &roll) {
  return roll[roll.size() - 1] + roll[roll.size() - 2];
}

TEST(EngineTest, MixedPoolMatchesEnumeration) {
  std::vector<Die> dice{standard_die(4), standard_die(6), standard_die(6)};
  Counts<Outcome> expected = enumerate_rolls<Outcome>(dice, top_two);
  Counts<Outcome> actual =
      sum_evaluator()->evaluate(source_expression(make_pool(dice)->highest(2)));
  EXPECT_EQ(actual, expected);
}

TEST(EngineTest, WeightedDiceMatchEnumeration) {
  Die loaded = Die::from_pairs({{1, 3}, {2, 1}, {5, 2}});
  std::vector<Die> dice{loaded, loaded, standard_die(3)};
  Counts<Outcome> expected =
      enumerate_rolls<Outcome>(dice, [](const std::vector<Outcome> &roll) {
        return roll[0] + roll[1] + roll[2];
      });
  EXPECT_EQ(sum_evaluator()->evaluate(source_expression(make_pool(dice))),
            expected);
}

TEST(EngineTest, TotalWeightIsProductOfDenominators) {
  ExpressionPtr a = source_expression(make_pool(standard_die(6), 2));
  ExpressionPtr b = source_expression(make_pool(standard_die(4), 3));
  Counts<Outcome> result =
      largest_count_evaluator()->evaluate(multiset_additive_union({a, b}));
  EXPECT_EQ(result.denominator(), Weight(36 * 64));
}

TEST(EngineTest, ForcedOrderDoesNotChangeResult) {
  ExpressionPtr input =
      source_expression(make_pool(standard_die(6), 4)->highest(3));
  EvaluationOptions ascending;
  ascending.forced_order = Order::Ascending;
  ascending.use_cache = false;
  EvaluationOptions descending;
  descending.forced_order = Order::Descending;
  descending.use_cache = false;
  EXPECT_EQ(sum_evaluator()->evaluate(input, ascending),
            sum_evaluator()->evaluate(input, descending));
}

template <typename R>
void expect_order_independent(const MultisetEvaluator<R> &evaluator,
                              const std::vector<ExpressionPtr> &inputs) {
  EvaluationOptions automatic;
  automatic.use_cache = false;
  EvaluationOptions ascending = automatic;
  ascending.forced_order = Order::Ascending;
  EvaluationOptions descending = automatic;
  descending.forced_order = Order::Descending;
  Counts<R> expected = evaluator.evaluate(inputs, automatic);
  EXPECT_FALSE(expected.empty());
  EXPECT_EQ(evaluator.evaluate(inputs, ascending), expected);
  EXPECT_EQ(evaluator.evaluate(inputs, descending), expected);
}

template <typename R>
void expect_fixed_order(const MultisetEvaluator<R> &evaluator,
                        const std::vector<ExpressionPtr> &inputs,
                        Order required) {
  EvaluationOptions automatic;
  automatic.use_cache = false;
  EvaluationOptions forced = automatic;
  forced.forced_order = required;
  EvaluationOptions opposite = automatic;
  opposite.forced_order = opposite_order(required);
  EXPECT_EQ(evaluator.evaluate(inputs, forced),
            evaluator.evaluate(inputs, automatic));
  EXPECT_THROW(evaluator.evaluate(inputs, opposite), UnsupportedOrder);
}

std::vector<Die> mixed_dice() {
  return {standard_die(4), standard_die(6), standard_die(6)};
}

TEST(EngineTest, UnaryEvaluatorsIgnoreFoldOrder) {
  ExpressionPtr pool = source_expression(make_pool(mixed_dice()));
  ExpressionPtr kept = source_expression(make_pool(mixed_dice())->highest(2));
  ExpressionPtr low = keep_outcomes(pool, {1, 2, 3});
  for (const ExpressionPtr &input : {pool, kept, low}) {
    std::vector<ExpressionPtr> inputs{input};
    expect_order_independent(*sum_evaluator(), inputs);
    expect_order_independent(*count_evaluator(), inputs);
    expect_order_independent(*any_evaluator(), inputs);
    expect_order_independent(*expand_evaluator(), inputs);
    expect_order_independent(*all_counts_evaluator(), inputs);
    expect_order_independent(*all_counts_evaluator(std::nullopt), inputs);
    expect_order_independent(*largest_count_evaluator(), inputs);
    expect_order_independent(*largest_straight_evaluator(), inputs);
    expect_order_independent(*highest_outcome_and_count_evaluator(), inputs);
    expect_order_independent(
        *joint_evaluator<Outcome>({sum_evaluator(), largest_count_evaluator()}),
        inputs);
  }
}

TEST(EngineTest, ComparisonsIgnoreFoldOrder) {
  std::vector<ExpressionPtr> inputs{
      source_expression(make_pool(standard_die(4), 2)),
      source_expression(make_pool({standard_die(3), standard_die(4)}))};
  for (const char *op : {"==", "!=", "<=", "<", ">=", ">", "issubset",
                         "issuperset", "isdisjoint"}) {
    expect_order_independent(*comparison_evaluator(op), inputs);
  }
}

TEST(EngineTest, DirectionalEvaluatorsRunInTheirOwnOrder) {
  std::vector<ExpressionPtr> pool{source_expression(make_pool(mixed_dice()))};
  expect_fixed_order(*keep_evaluator(1), pool, Order::Ascending);
  expect_fixed_order(*keep_evaluator(-1), pool, Order::Descending);

  std::vector<ExpressionPtr> pair{
      source_expression(make_pool(standard_die(6), 3)->highest(2)),
      source_expression(make_pool(standard_die(6), 2))};
  CompairScores wins;
  wins.left = 1;
  expect_fixed_order(*compair_evaluator(wins), pair, Order::Descending);
  expect_fixed_order(*compair_evaluator(wins, Order::Ascending), pair,
                     Order::Ascending);
}

TEST(EngineTest, KeepIndexMatchesEnumeration) {
  std::vector<Die> dice = mixed_dice();
  ExpressionPtr pool = source_expression(make_pool(dice));
  EXPECT_EQ(keep_evaluator(1)->evaluate(pool),
            enumerate_rolls<Outcome>(
                dice, [](const std::vector<Outcome> &roll) { return roll[1]; }));
  EXPECT_EQ(keep_evaluator(-1)->evaluate(pool),
            enumerate_rolls<Outcome>(
                dice, [](const std::vector<Outcome> &roll) { return roll.back(); }));
}

TEST(EngineTest, ExpressionKeepMatchesPoolKeep) {
  PoolPtr pool = make_pool(standard_die(6), 3);
  Counts<Outcome> folded =
      sum_evaluator()->evaluate(source_expression(pool->highest(2)));
  Counts<Outcome> stepped = sum_evaluator()->evaluate(
      highest(multiset_additive_union({source_expression(pool)}), 2));
  Counts<Outcome> sequence = sum_evaluator()->evaluate(
      keep(source_expression(pool), KeepSequence{kEllipsis, 1, 1}));
  EXPECT_EQ(folded, stepped);
  EXPECT_EQ(folded, sequence);
}

TEST(EngineTest, SharedPoolLeafIsNotFolded) {
  // Both operands see the same roll: the union equals the pool itself.
  ExpressionPtr rolled = source_expression(make_pool(standard_die(4), 2));
  Counts<Outcome> doubled = sum_evaluator()->evaluate(
      multiset_additive_union({highest(rolled, 1), highest(rolled, 1, 1)}));
  EXPECT_EQ(doubled, sum_evaluator()->evaluate(rolled));
}

TEST(EngineTest, StepBudgetIsEnforced) {
  EvaluationOptions options;
  options.step_budget = 1;
  options.use_cache = false;
  EXPECT_THROW(sum_evaluator()->evaluate(
                   source_expression(make_pool(standard_die(6), 3)), options),
               EvaluationBudgetExceeded);
}

TEST(EngineTest, ConflictingMandatoryOrdersAreReported) {
  ExpressionPtr paired = max_pair(testing_helpers::literal({1, 3}),
                                  Comparison::Less,
                                  testing_helpers::literal({2}));
  EXPECT_THROW(keep_evaluator(0)->evaluate(paired), ConflictingOrderError);
}

TEST(EngineTest, ArityMismatchIsReported) {
  ExpressionPtr one = testing_helpers::literal({1});
  EXPECT_THROW(sum_evaluator()->evaluate({one, one}), MultisetArityError);
}

TEST(EngineTest, UnknownLogLevelIsRejected) {
  EvaluationOptions options;
  options.log_level = "loud";
  EXPECT_THROW(sum_evaluator()->evaluate(testing_helpers::literal({1}), options),
               std::invalid_argument);
}

} // namespace
} // namespace rollr
