#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "die.h"

namespace rollr {

enum class Order : int { Ascending = 1, Descending = -1, Any = 0 };

// Priority of an order preference; higher values win.
enum class OrderReason : int {
  NoPreference = 0,
  Default = 1,
  KeepSkip = 2,
  PoolComposition = 3,
  Mandatory = 4
};

struct OrderPreference {
  Order order{Order::Any};
  OrderReason reason{OrderReason::NoPreference};
};

Order opposite_order(Order order);
const char *order_name(Order order);
const char *order_reason_name(OrderReason reason);

// Higher reasons strictly win. Equal reasons with opposing orders collapse
// to Any at the next reason up; opposing Mandatory orders throw
// ConflictingOrderError.
OrderPreference
merge_order_preferences(const std::vector<OrderPreference> &preferences);

// Whether the dice are one-sided truncations of a single base die.
// first: all dice share the top of the base (cheap to pop ascending).
// second: all dice share the bottom of the base (cheap to pop descending).
std::pair<bool, bool> can_truncate(const std::vector<Die> &dice);

// Leading and trailing zero entries of a keep tuple.
std::pair<int, int> lo_hi_skip(const std::vector<int> &keep_tuple);

OrderPreference pool_order_preference(const std::vector<Die> &unique_dice,
                                      const std::vector<int> &keep_tuple);

// Rough number of pop branches needed to consume the dice in `order`.
Weight estimate_pop_cost(const std::vector<std::pair<Die, int>> &dice,
                         Order order);

} // namespace rollr
