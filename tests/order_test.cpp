#include <gtest/gtest.h>

#include "die.h"
#include "errors.h"
#include "order.h"

namespace rollr {
namespace {

TEST(OrderTest, HigherReasonWins) {
  OrderPreference merged = merge_order_preferences(
      {{Order::Descending, OrderReason::Default},
       {Order::Ascending, OrderReason::KeepSkip}});
  EXPECT_EQ(merged.order, Order::Ascending);
  EXPECT_EQ(merged.reason, OrderReason::KeepSkip);
}

TEST(OrderTest, AnyAndNoPreferenceAreIgnored) {
  OrderPreference merged = merge_order_preferences(
      {{Order::Any, OrderReason::Mandatory},
       {Order::Ascending, OrderReason::NoPreference},
       {Order::Descending, OrderReason::Default}});
  EXPECT_EQ(merged.order, Order::Descending);
  EXPECT_EQ(merged.reason, OrderReason::Default);
  EXPECT_EQ(merge_order_preferences({}).order, Order::Any);
}

TEST(OrderTest, EqualReasonConflictCollapsesToAny) {
  OrderPreference merged = merge_order_preferences(
      {{Order::Descending, OrderReason::KeepSkip},
       {Order::Ascending, OrderReason::KeepSkip}});
  EXPECT_EQ(merged.order, Order::Any);
  EXPECT_EQ(merged.reason, OrderReason::PoolComposition);
}

TEST(OrderTest, OpposingMandatoryOrdersThrow) {
  EXPECT_THROW(merge_order_preferences(
                   {{Order::Descending, OrderReason::Mandatory},
                    {Order::Ascending, OrderReason::Mandatory}}),
               ConflictingOrderError);
}

TEST(OrderTest, TruncationOfSharedBase) {
  auto both = can_truncate({standard_die(6), standard_die(6)});
  EXPECT_TRUE(both.first);
  EXPECT_TRUE(both.second);

  auto bottom = can_truncate({standard_die(4), standard_die(6)});
  EXPECT_FALSE(bottom.first);
  EXPECT_TRUE(bottom.second);

  Die high_half = make_die(std::vector<DieEntry>{4, 5, 6});
  auto top = can_truncate({high_half, standard_die(6)});
  EXPECT_TRUE(top.first);
  EXPECT_FALSE(top.second);
}

TEST(OrderTest, LoHiSkip) {
  EXPECT_EQ(lo_hi_skip({0, 0, 1, 1}), std::make_pair(2, 0));
  EXPECT_EQ(lo_hi_skip({1, 0, 0}), std::make_pair(0, 2));
  EXPECT_EQ(lo_hi_skip({0, 0, 0}), std::make_pair(3, 3));
}

TEST(OrderTest, PoolPreferenceFollowsSkippedEnd) {
  OrderPreference prefer_high =
      pool_order_preference({standard_die(6)}, {0, 0, 1});
  EXPECT_EQ(prefer_high.order, Order::Descending);
  EXPECT_EQ(prefer_high.reason, OrderReason::KeepSkip);

  OrderPreference mixed =
      pool_order_preference({standard_die(4), standard_die(6)}, {1, 1});
  EXPECT_EQ(mixed.order, Order::Descending);
  EXPECT_EQ(mixed.reason, OrderReason::PoolComposition);
}

} // namespace
} // namespace rollr
