#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "evaluators.h"
#include "pool.h"

namespace rollr {
namespace {

Weight total_pop_weight(const PoolPtr &pool, Order order, Outcome outcome) {
  Weight total = 0;
  for (const SourcePop &branch : pool->pop(order, outcome)) {
    total += branch.weight * branch.next->denominator();
  }
  return total;
}

TEST(PoolTest, DenominatorAndSizes) {
  PoolPtr pool = make_pool(standard_die(6), 3);
  EXPECT_EQ(pool->denominator(), Weight(216));
  EXPECT_EQ(pool->raw_size(), 3);
  EXPECT_EQ(pool->keep_size(), 3);
  EXPECT_EQ(pool->keep_tuple(), (std::vector<int>{1, 1, 1}));
}

TEST(PoolTest, IdenticalDiceMergeRegardlessOfOrder) {
  PoolPtr a = make_pool({standard_die(4), standard_die(6), standard_die(4)});
  PoolPtr b = make_pool({standard_die(6), standard_die(4), standard_die(4)});
  EXPECT_TRUE(a->equals(*b));
  EXPECT_EQ(a->dice().size(), 2u);
}

TEST(PoolTest, KeepSelectsRanks) {
  PoolPtr pool = make_pool(standard_die(6), 3);
  EXPECT_EQ(pool->highest(1)->keep_tuple(), (std::vector<int>{0, 0, 1}));
  EXPECT_EQ(pool->lowest(2)->keep_tuple(), (std::vector<int>{1, 1, 0}));
  EXPECT_EQ(pool->middle(1)->keep_tuple(), (std::vector<int>{0, 1, 0}));
  EXPECT_EQ(pool->highest(1)->keep_size(), 1);
}

TEST(PoolTest, KeepComposesOnSelectedRanks) {
  PoolPtr pool = make_pool(standard_die(6), 4)->highest(3)->lowest(1);
  EXPECT_EQ(pool->keep_tuple(), (std::vector<int>{0, 1, 0, 0}));
}

TEST(PoolTest, NegativeKeepsCannotBeSubscripted) {
  PoolPtr pool = make_pool(standard_die(6), 2)->multiply_counts(-1);
  EXPECT_TRUE(pool->has_negative_keeps());
  EXPECT_THROW(pool->highest(1), std::out_of_range);
}

TEST(PoolTest, PopBranchesConserveWeight) {
  PoolPtr pool = make_pool({standard_die(4), standard_die(6), standard_die(6)});
  EXPECT_EQ(total_pop_weight(pool, Order::Descending, 6), pool->denominator());
  EXPECT_EQ(total_pop_weight(pool, Order::Ascending, 1), pool->denominator());

  PoolPtr kept = pool->highest(1);
  EXPECT_EQ(total_pop_weight(kept, Order::Descending, 6), kept->denominator());
}

TEST(PoolTest, PopOfNonExtremeOutcomeIsUnchanged) {
  PoolPtr pool = make_pool(standard_die(6), 2);
  std::vector<SourcePop> branches = pool->pop(Order::Descending, 3);
  ASSERT_EQ(branches.size(), 1u);
  EXPECT_EQ(branches[0].next.get(), pool.get());
  EXPECT_EQ(branches[0].counts, (std::vector<int>{0}));
  EXPECT_EQ(branches[0].weight, Weight(1));
}

TEST(PoolTest, LiteralIsCertain) {
  PoolPtr pool = multiset_literal({1, 2, 2, 3});
  EXPECT_EQ(pool->denominator(), Weight(1));
  Counts<Outcome> sum = sum_evaluator()->evaluate(source_expression(pool));
  ASSERT_EQ(sum.size(), 1u);
  EXPECT_EQ(sum.key(0), 8);
}

TEST(PoolTest, EmptyDieMakesPoolUnresolvable) {
  PoolPtr pool = make_pool({standard_die(6), Die()});
  EXPECT_FALSE(pool->is_resolvable());
  EXPECT_TRUE(sum_evaluator()->evaluate(source_expression(pool)).empty());
}

} // namespace
} // namespace rollr
