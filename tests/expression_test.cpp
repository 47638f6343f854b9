#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "errors.h"
#include "evaluators.h"
#include "multiset_expression.h"
#include "test_helpers.h"

namespace rollr {
namespace {

using testing_helpers::expand_certain;
using testing_helpers::literal;
using Elements = std::vector<Outcome>;

TEST(ExpressionTest, SetOperations) {
  ExpressionPtr a = literal({1, 2, 2, 3});
  ExpressionPtr b = literal({1, 2, 4});
  EXPECT_EQ(expand_certain(multiset_union({a, b})), (Elements{1, 2, 2, 3, 4}));
  EXPECT_EQ(expand_certain(multiset_intersection({a, b})), (Elements{1, 2}));
  EXPECT_EQ(expand_certain(multiset_difference({a, b})), (Elements{2, 3}));
  EXPECT_EQ(expand_certain(multiset_symmetric_difference(a, b)),
            (Elements{2, 3, 4}));
  EXPECT_EQ(expand_certain(multiset_additive_union({a, b})),
            (Elements{1, 1, 2, 2, 2, 3, 4}));
}

TEST(ExpressionTest, DifferenceCanKeepNegativeCounts) {
  ExpressionPtr diff =
      multiset_difference({literal({1}), literal({1, 1, 2})}, true);
  Counts<Outcome> sum = sum_evaluator()->evaluate(diff);
  ASSERT_EQ(sum.size(), 1u);
  EXPECT_EQ(sum.key(0), -3);
}

TEST(ExpressionTest, CountArithmetic) {
  EXPECT_EQ(expand_certain(multiply_counts(literal({1, 2}), 2)),
            (Elements{1, 1, 2, 2}));
  EXPECT_EQ(expand_certain(divide_counts(literal({1, 1, 1, 2}), 2)),
            (Elements{1}));
  EXPECT_EQ(expand_certain(modulo_counts(literal({1, 1, 1, 2, 2}), 2)),
            (Elements{1}));
  EXPECT_THROW(divide_counts(literal({1}), 0), std::invalid_argument);
}

TEST(ExpressionTest, CountFilters) {
  ExpressionPtr rolled = literal({1, 1, 2, 3, 3, 3});
  EXPECT_EQ(expand_certain(keep_counts(rolled, Comparison::GreaterEqual, 2)),
            (Elements{1, 1, 3, 3, 3}));
  EXPECT_EQ(expand_certain(unique_counts(rolled)), (Elements{1, 2, 3}));
  EXPECT_EQ(expand_certain(unique_counts(rolled, 2)),
            (Elements{1, 1, 2, 3, 3}));
}

TEST(ExpressionTest, OutcomeFilters) {
  ExpressionPtr rolled = literal({1, 2, 3, 3});
  EXPECT_EQ(expand_certain(keep_outcomes(rolled, {3})), (Elements{3, 3}));
  EXPECT_EQ(expand_certain(drop_outcomes(rolled, {3})), (Elements{1, 2}));
  auto odd = [](Outcome x) { return x % 2 != 0; };
  EXPECT_EQ(expand_certain(keep_outcomes_if(rolled, odd)),
            (Elements{1, 3, 3}));
  EXPECT_EQ(expand_certain(drop_outcomes_if(rolled, odd)), (Elements{2}));

  ExpressionPtr targets = literal({2, 5});
  EXPECT_EQ(expand_certain(keep_outcomes_in(literal({1, 2, 3}), targets)),
            (Elements{2}));
  EXPECT_EQ(expand_certain(drop_outcomes_in(literal({1, 2, 3}), targets)),
            (Elements{1, 3}));
}

TEST(ExpressionTest, PredicateFiltersAreNotCached) {
  auto evaluator = std::make_shared<SumEvaluator>();
  ExpressionPtr filtered =
      keep_outcomes_if(literal({1, 2}), [](Outcome x) { return x > 1; });
  evaluator->evaluate(filtered);
  EXPECT_EQ(evaluator->cache_size(), 0u);
}

TEST(ExpressionTest, KeepOnNonPoolOperand) {
  ExpressionPtr rolled =
      multiset_additive_union({literal({1, 5, 3}), literal({4})});
  EXPECT_EQ(expand_certain(highest(rolled, 2)), (Elements{4, 5}));
  EXPECT_EQ(expand_certain(lowest(rolled, 1)), (Elements{1}));
  EXPECT_EQ(expand_certain(highest(rolled, 1, 1)), (Elements{4}));
  EXPECT_EQ(expand_certain(keep(rolled, 1)), (Elements{3}));
  EXPECT_EQ(expand_certain(keep(rolled, -1)), (Elements{5}));
  EXPECT_EQ(expand_certain(keep(rolled, KeepSlice{1, 3, std::nullopt})),
            (Elements{3, 4}));
}

TEST(ExpressionTest, KeepTreatsNegativeCountsAsAbsent) {
  ExpressionPtr signed_counts =
      multiset_difference({literal({1, 5}), literal({1, 1, 3})}, true);
  EXPECT_EQ(expand_certain(highest(signed_counts, 1)), (Elements{5}));
  EXPECT_EQ(expand_certain(lowest(signed_counts, 1)), (Elements{5}));
  EXPECT_EQ(expand_certain(keep(signed_counts, KeepSlice{std::nullopt, 2,
                                                         std::nullopt})),
            (Elements{5}));
}

TEST(ExpressionTest, KeepRejectsOperandsThatAreTooSmall) {
  ExpressionPtr rolled = multiset_additive_union({literal({1, 2})});
  EXPECT_THROW(sum_evaluator()->evaluate(keep(rolled, 5)), std::out_of_range);
}

TEST(ExpressionTest, CenterEllipsisNeedsPoolOperand) {
  KeepSequence ends{1, kEllipsis, 1};
  ExpressionPtr pooled = keep(literal({1, 2, 3, 4}), ends);
  EXPECT_EQ(expand_certain(pooled), (Elements{1, 4}));

  ExpressionPtr mixed = keep(multiset_additive_union({literal({1, 2, 3, 4})}),
                             ends);
  EXPECT_THROW(sum_evaluator()->evaluate(mixed), std::invalid_argument);
}

TEST(ExpressionTest, SortPairKeepsWinningLeftElements) {
  ExpressionPtr left = literal({5, 3, 1});
  ExpressionPtr right = literal({4, 4, 2});
  EXPECT_EQ(expand_certain(sort_pair(left, Comparison::Greater, right)),
            (Elements{5}));
  EXPECT_EQ(expand_certain(sort_pair(left, Comparison::Less, right)),
            (Elements{1, 3}));
}

TEST(ExpressionTest, SortPairExtraElements) {
  ExpressionPtr left = literal({6, 5, 1});
  ExpressionPtr right = literal({4});
  EXPECT_EQ(expand_certain(sort_pair(left, Comparison::Greater, right,
                                     Order::Descending, PairExtra::Drop)),
            (Elements{6}));
  EXPECT_EQ(expand_certain(sort_pair(left, Comparison::Greater, right,
                                     Order::Descending, PairExtra::Keep)),
            (Elements{1, 5, 6}));
}

TEST(ExpressionTest, MaxPairFormsAsManyPairsAsPossible) {
  ExpressionPtr left = literal({1, 3, 5});
  ExpressionPtr right = literal({2, 4});
  EXPECT_EQ(expand_certain(max_pair(left, Comparison::Less, right)),
            (Elements{1, 3}));
  EXPECT_EQ(expand_certain(max_pair(left, Comparison::Less, right, false)),
            (Elements{5}));
  EXPECT_THROW(max_pair(left, Comparison::NotEqual, right),
               std::invalid_argument);
}

TEST(ExpressionTest, MaxPairRefusesForcedAscendingOrder) {
  EvaluationOptions options;
  options.forced_order = Order::Ascending;
  ExpressionPtr paired =
      max_pair(literal({1, 3}), Comparison::Less, literal({2}));
  EXPECT_THROW(sum_evaluator()->evaluate(paired, options), UnsupportedOrder);
}

TEST(ExpressionTest, OperatorsRequireUnaryOperands) {
  DealPtr deal = make_deal(make_deck({1, 2, 3}, 1), std::vector<int>{1, 1});
  EXPECT_EQ(expression_arity(source_expression(deal)), 2);
  EXPECT_THROW(multiset_union({source_expression(deal), literal({1})}),
               MultisetArityError);
  Counts<Outcome> sizes =
      count_evaluator()->evaluate(multiset_union({hand_expression(deal, 0),
                                                  literal({1})}));
  EXPECT_EQ(sizes.reduce(), Counts<Outcome>::from_pairs({{1, 1}, {2, 2}}));
}

TEST(ExpressionTest, UnboundVariableCannotBeEvaluated) {
  EXPECT_THROW(sum_evaluator()->evaluate(multiset_variable(0)),
               MultisetBindingError);
}

} // namespace
} // namespace rollr
