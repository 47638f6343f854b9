#include "order.h"

#include <cstddef>

#include "errors.h"
#include "weight_math.h"

namespace rollr {

Order opposite_order(Order order) {
  switch (order) {
  case Order::Ascending:
    return Order::Descending;
  case Order::Descending:
    return Order::Ascending;
  default:
    return Order::Any;
  }
}

const char *order_name(Order order) {
  switch (order) {
  case Order::Ascending:
    return "ascending";
  case Order::Descending:
    return "descending";
  default:
    return "any";
  }
}

const char *order_reason_name(OrderReason reason) {
  switch (reason) {
  case OrderReason::Default:
    return "default";
  case OrderReason::KeepSkip:
    return "keep_skip";
  case OrderReason::PoolComposition:
    return "pool_composition";
  case OrderReason::Mandatory:
    return "mandatory";
  default:
    return "no_preference";
  }
}

OrderPreference
merge_order_preferences(const std::vector<OrderPreference> &preferences) {
  OrderPreference result;
  for (const OrderPreference &pref : preferences) {
    if (pref.order == Order::Any || pref.reason == OrderReason::NoPreference) {
      continue;
    }
    if (pref.reason > result.reason) {
      result = pref;
    } else if (pref.reason == result.reason) {
      if (result.order == Order::Any) {
        result.order = pref.order;
      } else if (result.order == pref.order) {
        continue;
      } else if (result.reason < OrderReason::Mandatory) {
        result.order = Order::Any;
        result.reason =
            static_cast<OrderReason>(static_cast<int>(result.reason) + 1);
      } else {
        throw ConflictingOrderError(
            "conflicting mandatory order preferences; try lowest(drop) "
            "instead of highest(keep) or vice versa");
      }
    }
  }
  return result;
}

std::pair<bool, bool> can_truncate(const std::vector<Die> &dice) {
  if (dice.empty()) {
    return {true, true};
  }
  const Die *base = &dice.front();
  bool truncate_min = true;
  bool truncate_max = true;
  for (std::size_t i = 1; i < dice.size(); ++i) {
    const Die *die = &dice[i];
    if (die->size() == base->size()) {
      if (*die == *base) {
        continue;
      }
      return {false, false};
    }
    if (die->size() > base->size()) {
      std::swap(base, die);
    }
    const auto &small = die->items();
    const auto &large = base->items();
    if (truncate_min) {
      for (std::size_t j = 0; j < small.size(); ++j) {
        if (small[small.size() - 1 - j] != large[large.size() - 1 - j]) {
          truncate_min = false;
          break;
        }
      }
    }
    if (truncate_max) {
      for (std::size_t j = 0; j < small.size(); ++j) {
        if (small[j] != large[j]) {
          truncate_max = false;
          break;
        }
      }
    }
    if (!truncate_min && !truncate_max) {
      return {false, false};
    }
  }
  return {truncate_min, truncate_max};
}

std::pair<int, int> lo_hi_skip(const std::vector<int> &keep_tuple) {
  const int n = static_cast<int>(keep_tuple.size());
  int lo = 0;
  while (lo < n && keep_tuple[static_cast<std::size_t>(lo)] == 0) {
    ++lo;
  }
  if (lo == n) {
    return {n, n};
  }
  int hi = 0;
  while (keep_tuple[static_cast<std::size_t>(n - 1 - hi)] == 0) {
    ++hi;
  }
  return {lo, hi};
}

OrderPreference pool_order_preference(const std::vector<Die> &unique_dice,
                                      const std::vector<int> &keep_tuple) {
  auto truncation = can_truncate(unique_dice);
  if (truncation.first && !truncation.second) {
    return {Order::Ascending, OrderReason::PoolComposition};
  }
  if (truncation.second && !truncation.first) {
    return {Order::Descending, OrderReason::PoolComposition};
  }
  auto skip = lo_hi_skip(keep_tuple);
  if (skip.first > skip.second) {
    return {Order::Descending, OrderReason::KeepSkip};
  }
  if (skip.second > skip.first) {
    return {Order::Ascending, OrderReason::KeepSkip};
  }
  return {};
}

Weight estimate_pop_cost(const std::vector<std::pair<Die, int>> &dice,
                         Order order) {
  std::vector<Die> unique;
  unique.reserve(dice.size());
  for (const auto &entry : dice) {
    unique.push_back(entry.first);
  }
  auto truncation = can_truncate(unique);
  bool cheap = (order == Order::Ascending && truncation.first) ||
               (order == Order::Descending && truncation.second);
  Weight cost = cheap ? 0 : 1;
  for (const auto &entry : dice) {
    if (cheap) {
      cost += Weight(entry.first.size()) * entry.second;
    } else {
      cost *= weight_pow(Weight(entry.first.size()),
                         static_cast<unsigned>(entry.second));
    }
  }
  return cost;
}

} // namespace rollr
