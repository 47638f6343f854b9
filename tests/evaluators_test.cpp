#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.h"
#include "evaluators.h"
#include "test_helpers.h"

namespace rollr {
namespace {

using testing_helpers::literal;

template <typename R> R certain(const Counts<R> &counts) {
  EXPECT_EQ(counts.size(), 1u);
  return counts.key(0);
}

TEST(EvaluatorsTest, SumOfTwoDice) {
  Counts<Outcome> sums = sum_evaluator()->evaluate(
      source_expression(make_pool(standard_die(6), 2)));
  EXPECT_EQ(sums.denominator(), Weight(36));
  EXPECT_EQ(sums[7], Weight(6));
  EXPECT_EQ(sums[2], Weight(1));
}

TEST(EvaluatorsTest, CountAndAny) {
  EXPECT_EQ(certain(count_evaluator()->evaluate(literal({1, 1, 2, 5}))), 4);
  EXPECT_FALSE(
      certain(any_evaluator()->evaluate(drop_outcomes(literal({1, 1}), {1}))));
  EXPECT_TRUE(certain(any_evaluator()->evaluate(literal({3}))));
}

TEST(EvaluatorsTest, AllCountsSortedDescending) {
  using Row = std::vector<std::int64_t>;
  EXPECT_EQ(certain(all_counts_evaluator()->evaluate(
                literal({1, 1, 2, 3, 3, 3}))),
            (Row{3, 2, 1}));
  ExpressionPtr shared =
      multiset_intersection({literal({1, 3}), literal({2, 3})});
  EXPECT_EQ(certain(all_counts_evaluator(std::nullopt)->evaluate(shared)),
            (Row{1, 0, 0}));
  EXPECT_EQ(certain(all_counts_evaluator()->evaluate(shared)), (Row{1}));
}

TEST(EvaluatorsTest, LargestCountAndStraight) {
  EXPECT_EQ(certain(largest_count_evaluator()->evaluate(
                literal({1, 1, 2, 3, 3, 3}))),
            3);
  EXPECT_EQ(certain(largest_straight_evaluator()->evaluate(
                literal({1, 2, 3, 5, 6}))),
            3);
  EXPECT_EQ(certain(largest_straight_evaluator()->evaluate(
                literal({2, 2, 4, 6}))),
            1);
}

TEST(EvaluatorsTest, HighestOutcomeAndCount) {
  auto result = certain(
      highest_outcome_and_count_evaluator()->evaluate(literal({1, 3, 3})));
  EXPECT_EQ(result.first, 3);
  EXPECT_EQ(result.second, 2);
}

using OutcomeAndCount = std::pair<Outcome, std::int64_t>;

OutcomeAndCount top_outcome_and_count(const std::vector<Outcome> &roll) {
  std::int64_t count = 0;
  for (Outcome x : roll) {
    count += x == roll.back() ? 1 : 0;
  }
  return {roll.back(), count};
}

TEST(EvaluatorsTest, HighestOutcomeAndCountOfTwoDice) {
  ExpressionPtr pool = source_expression(make_pool(standard_die(6), 2));
  std::vector<Counts<OutcomeAndCount>::item_type> pairs;
  for (Outcome k = 1; k <= 6; ++k) {
    pairs.emplace_back(OutcomeAndCount{k, 1}, Weight(2 * k - 2));
    pairs.emplace_back(OutcomeAndCount{k, 2}, Weight(1));
  }
  Counts<OutcomeAndCount> expected =
      Counts<OutcomeAndCount>::from_pairs(std::move(pairs));
  for (Order order : {Order::Ascending, Order::Descending}) {
    EvaluationOptions options;
    options.forced_order = order;
    options.use_cache = false;
    EXPECT_EQ(highest_outcome_and_count_evaluator()->evaluate(pool, options),
              expected);
  }
  EXPECT_EQ(highest_outcome_and_count_evaluator()->evaluate(pool), expected);
}

TEST(EvaluatorsTest, HighestOutcomeAndCountOfMixedPool) {
  std::vector<Die> dice{standard_die(4), standard_die(6), standard_die(8)};
  Counts<OutcomeAndCount> expected =
      testing_helpers::enumerate_rolls<OutcomeAndCount>(dice,
                                                        top_outcome_and_count);
  EXPECT_EQ(highest_outcome_and_count_evaluator()->evaluate(
                source_expression(make_pool(dice))),
            expected);
}

TEST(EvaluatorsTest, HighestOutcomeAndCountWithNothingPresent) {
  auto result = certain(highest_outcome_and_count_evaluator()->evaluate(
      drop_outcomes(literal({2, 3, 3}), {2, 3})));
  EXPECT_EQ(result.first, 2);
  EXPECT_EQ(result.second, 0);

  Counts<OutcomeAndCount> dropped =
      highest_outcome_and_count_evaluator()->evaluate(
          source_expression(make_pool(standard_die(6), 2)->highest(0)));
  ASSERT_EQ(dropped.size(), 1u);
  EXPECT_EQ(dropped.key(0), (OutcomeAndCount{1, 0}));
}

TEST(EvaluatorsTest, KeepIndex) {
  ExpressionPtr rolled = literal({4, 2, 7});
  EXPECT_EQ(certain(keep_evaluator(0)->evaluate(rolled)), 2);
  EXPECT_EQ(certain(keep_evaluator(1)->evaluate(rolled)), 4);
  EXPECT_EQ(certain(keep_evaluator(-1)->evaluate(rolled)), 7);
  EXPECT_THROW(keep_evaluator(5)->evaluate(rolled), std::out_of_range);
}

TEST(EvaluatorsTest, SetComparisons) {
  ExpressionPtr small = literal({1, 2});
  ExpressionPtr large = literal({1, 2, 3});
  auto compare = [&](const std::string &op, const ExpressionPtr &left,
                     const ExpressionPtr &right) {
    return certain(comparison_evaluator(op)->evaluate({left, right}));
  };
  EXPECT_TRUE(compare("<", small, large));
  EXPECT_TRUE(compare("<=", small, large));
  EXPECT_TRUE(compare("issubset", small, large));
  EXPECT_TRUE(compare("!=", small, large));
  EXPECT_FALSE(compare("==", small, large));
  EXPECT_FALSE(compare(">", small, large));
  EXPECT_FALSE(compare("issuperset", small, large));
  EXPECT_TRUE(compare("==", small, literal({2, 1})));
  EXPECT_FALSE(compare("<", small, literal({2, 1})));
  EXPECT_TRUE(compare("isdisjoint", small, literal({3})));
  EXPECT_FALSE(compare("isdisjoint", small, literal({2})));
  EXPECT_THROW(parse_set_comparison("~"), std::invalid_argument);
}

TEST(EvaluatorsTest, ComparisonNeedsTwoInputs) {
  EXPECT_THROW(comparison_evaluator("<")->evaluate(literal({1})),
               MultisetArityError);
}

TEST(EvaluatorsTest, CompairScoresSortedPairs) {
  ExpressionPtr left = literal({6, 3});
  ExpressionPtr right = literal({5, 4});
  CompairScores net;
  net.left = 1;
  net.right = -1;
  EXPECT_EQ(certain(compair_evaluator(net)->evaluate({left, right})), 0);

  CompairScores wins;
  wins.left = 1;
  EXPECT_EQ(certain(compair_evaluator(wins)->evaluate({left, right})), 1);

  // Ascending: the lower element wins the pair.
  EXPECT_EQ(certain(compair_evaluator(wins, Order::Ascending)
                        ->evaluate({left, right})),
            1);
  EXPECT_THROW(compair_evaluator(wins, Order::Any), std::invalid_argument);
}

TEST(EvaluatorsTest, FunctionEvaluatorCountsDistinctOutcomes) {
  auto distinct = function_evaluator<Outcome>(
      [](Order, const std::vector<Outcome> &, const std::vector<int> &) {
        return EvalState{0};
      },
      [](const EvalState &state, Order, Outcome,
         const std::vector<int> &counts) -> std::optional<EvalState> {
        return EvalState{state[0] + (counts[0] > 0 ? 1 : 0)};
      },
      [](const EvalState &state) -> std::optional<Outcome> {
        return state[0];
      });
  EXPECT_EQ(certain(distinct->evaluate(literal({1, 1, 2}))), 2);
  EXPECT_EQ(distinct->cache_size(), 0u);
}

TEST(EvaluatorsTest, FunctionEvaluatorRerollDropsPaths) {
  // Conditions on the die showing more than 2.
  auto above_two = function_evaluator<Outcome>(
      [](Order, const std::vector<Outcome> &, const std::vector<int> &) {
        return EvalState{0};
      },
      [](const EvalState &state, Order, Outcome outcome,
         const std::vector<int> &counts) -> std::optional<EvalState> {
        if (counts[0] > 0 && outcome <= 2) {
          return std::nullopt;
        }
        return EvalState{state[0] + outcome * counts[0]};
      },
      [](const EvalState &state) -> std::optional<Outcome> {
        return state[0];
      });
  Counts<Outcome> result = above_two->evaluate(
      source_expression(make_pool(standard_die(6), 1)));
  EXPECT_EQ(result, Counts<Outcome>::from_pairs(
                        {{3, 1}, {4, 1}, {5, 1}, {6, 1}}));
}

TEST(EvaluatorsTest, JointEvaluatorRunsMembersTogether) {
  auto joint = joint_evaluator<Outcome>({sum_evaluator(), count_evaluator()});
  EXPECT_EQ(certain(joint->evaluate(literal({1, 2}))),
            (std::vector<Outcome>{3, 2}));
  auto with_lowest =
      joint_evaluator<Outcome>({sum_evaluator(), keep_evaluator(0)});
  EXPECT_EQ(certain(with_lowest->evaluate(literal({3, 1}))),
            (std::vector<Outcome>{4, 1}));
}

TEST(EvaluatorsTest, CacheHitsAndEvictions) {
  SumEvaluator evaluator;
  ExpressionPtr two = source_expression(make_pool(standard_die(6), 2));
  ExpressionPtr three = source_expression(make_pool(standard_die(6), 3));
  Counts<Outcome> first = evaluator.evaluate(two);
  Counts<Outcome> second = evaluator.evaluate(
      source_expression(make_pool(standard_die(6), 2)));
  EXPECT_EQ(first, second);
  EXPECT_EQ(evaluator.cache_metrics().hits, 1u);
  EXPECT_EQ(evaluator.cache_metrics().misses, 1u);

  EvaluationOptions small;
  small.cache_limit = 1;
  evaluator.evaluate(three, small);
  EXPECT_EQ(evaluator.cache_metrics().evictions, 1u);
  EXPECT_EQ(evaluator.cache_size(), 1u);

  EvaluationOptions uncached;
  uncached.use_cache = false;
  evaluator.evaluate(two, uncached);
  EXPECT_EQ(evaluator.cache_metrics().misses, 2u);
  evaluator.clear_cache();
  EXPECT_EQ(evaluator.cache_size(), 0u);
}

} // namespace
} // namespace rollr
