#include "evaluators.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace rollr {
namespace {

void require_non_negative(const std::vector<int> &counts, const char *name) {
  for (int count : counts) {
    if (count < 0) {
      throw std::out_of_range(std::string(name) +
                              ": negative counts are not supported");
    }
  }
}

} // namespace

EvalState SumEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                      const std::vector<int> &) const {
  return {0};
}

std::optional<EvalState>
SumEvaluator::next_state(const EvalState &state, Order, Outcome outcome,
                         const std::vector<int> &counts) const {
  return EvalState{state[0] + outcome * counts[0]};
}

std::optional<Outcome> SumEvaluator::final_outcome(const EvalState &state) const {
  return state[0];
}

EvalState CountEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                        const std::vector<int> &) const {
  return {0};
}

std::optional<EvalState>
CountEvaluator::next_state(const EvalState &state, Order, Outcome,
                           const std::vector<int> &counts) const {
  return EvalState{state[0] + counts[0]};
}

std::optional<Outcome>
CountEvaluator::final_outcome(const EvalState &state) const {
  return state[0];
}

EvalState AnyEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                      const std::vector<int> &) const {
  return {0};
}

std::optional<EvalState>
AnyEvaluator::next_state(const EvalState &state, Order, Outcome,
                         const std::vector<int> &counts) const {
  return EvalState{state[0] != 0 || counts[0] > 0 ? 1 : 0};
}

std::optional<bool> AnyEvaluator::final_outcome(const EvalState &state) const {
  return state[0] != 0;
}

EvalState ExpandEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                         const std::vector<int> &) const {
  return {};
}

std::optional<EvalState>
ExpandEvaluator::next_state(const EvalState &state, Order, Outcome outcome,
                            const std::vector<int> &counts) const {
  require_non_negative(counts, "expand");
  EvalState next = state;
  next.insert(next.end(), static_cast<std::size_t>(counts[0]), outcome);
  return next;
}

std::optional<std::vector<Outcome>>
ExpandEvaluator::final_outcome(const EvalState &state) const {
  std::vector<Outcome> out(state.begin(), state.end());
  std::sort(out.begin(), out.end());
  return out;
}

EvalState AllCountsEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                            const std::vector<int> &) const {
  return {};
}

std::optional<EvalState>
AllCountsEvaluator::next_state(const EvalState &state, Order, Outcome,
                               const std::vector<int> &counts) const {
  if (min_count_ && counts[0] < *min_count_) {
    return state;
  }
  EvalState next = state;
  auto pos = std::upper_bound(next.begin(), next.end(),
                              static_cast<std::int64_t>(counts[0]),
                              [](std::int64_t a, std::int64_t b) { return a > b; });
  next.insert(pos, counts[0]);
  return next;
}

std::optional<std::vector<std::int64_t>>
AllCountsEvaluator::final_outcome(const EvalState &state) const {
  return std::vector<std::int64_t>(state.begin(), state.end());
}

std::vector<Outcome>
AllCountsEvaluator::extra_outcomes(const std::vector<Outcome> &outcomes) const {
  return outcomes;
}

std::string AllCountsEvaluator::cache_key() const {
  return min_count_ ? "all_counts>=" + std::to_string(*min_count_)
                    : std::string("all_counts");
}

EvalState LargestCountEvaluator::initial_state(Order,
                                               const std::vector<Outcome> &,
                                               const std::vector<int> &) const {
  return {0};
}

std::optional<EvalState>
LargestCountEvaluator::next_state(const EvalState &state, Order, Outcome,
                                  const std::vector<int> &counts) const {
  return EvalState{std::max<std::int64_t>(state[0], counts[0])};
}

std::optional<Outcome>
LargestCountEvaluator::final_outcome(const EvalState &state) const {
  return state[0];
}

// State: best run, current run.
EvalState
LargestStraightEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                        const std::vector<int> &) const {
  return {0, 0};
}

std::optional<EvalState>
LargestStraightEvaluator::next_state(const EvalState &state, Order, Outcome,
                                     const std::vector<int> &counts) const {
  std::int64_t run = counts[0] >= 1 ? state[1] + 1 : 0;
  return EvalState{std::max(state[0], run), run};
}

std::optional<Outcome>
LargestStraightEvaluator::final_outcome(const EvalState &state) const {
  return state[0];
}

std::vector<Outcome> LargestStraightEvaluator::extra_outcomes(
    const std::vector<Outcome> &outcomes) const {
  std::vector<Outcome> out;
  if (outcomes.empty()) {
    return out;
  }
  for (Outcome x = outcomes.front(); x <= outcomes.back(); ++x) {
    out.push_back(x);
  }
  return out;
}

// State: seen flag, lowest outcome seen, positive flag, highest outcome with
// a positive count, its count. Independent of the fold order.
EvalState HighestOutcomeAndCountEvaluator::initial_state(
    Order, const std::vector<Outcome> &, const std::vector<int> &) const {
  return {0, 0, 0, 0, 0};
}

std::optional<EvalState> HighestOutcomeAndCountEvaluator::next_state(
    const EvalState &state, Order, Outcome outcome,
    const std::vector<int> &counts) const {
  const std::int64_t count = counts[0];
  EvalState next = state;
  next[1] = state[0] == 0 ? outcome : std::min(outcome, state[1]);
  next[0] = 1;
  if (count > 0 && (state[2] == 0 || outcome > state[3])) {
    next[2] = 1;
    next[3] = outcome;
    next[4] = count;
  }
  return next;
}

std::optional<std::pair<Outcome, std::int64_t>>
HighestOutcomeAndCountEvaluator::final_outcome(const EvalState &state) const {
  if (state[0] == 0) {
    return std::nullopt;
  }
  if (state[2] == 0) {
    return std::make_pair(state[1], std::int64_t{0});
  }
  return std::make_pair(state[3], state[4]);
}

std::vector<Outcome> HighestOutcomeAndCountEvaluator::extra_outcomes(
    const std::vector<Outcome> &outcomes) const {
  return outcomes;
}

OrderPreference KeepIndexEvaluator::order_preference() const {
  return {index_ >= 0 ? Order::Ascending : Order::Descending,
          OrderReason::Mandatory};
}

// State: found flag, result, elements still to pass.
EvalState KeepIndexEvaluator::initial_state(Order order,
                                            const std::vector<Outcome> &,
                                            const std::vector<int> &) const {
  if ((order == Order::Ascending) != (index_ >= 0)) {
    throw UnsupportedOrder("keep_evaluator: index " + std::to_string(index_) +
                           " cannot be reached in " + order_name(order) +
                           " order");
  }
  return {0, 0, index_ >= 0 ? index_ + 1 : -static_cast<std::int64_t>(index_)};
}

std::optional<EvalState>
KeepIndexEvaluator::next_state(const EvalState &state, Order, Outcome outcome,
                               const std::vector<int> &counts) const {
  EvalState next = state;
  next[2] = std::max<std::int64_t>(
      next[2] - std::max<std::int64_t>(counts[0], 0), 0);
  if (next[2] == 0 && next[0] == 0) {
    next[0] = 1;
    next[1] = outcome;
  }
  return next;
}

std::optional<Outcome>
KeepIndexEvaluator::final_outcome(const EvalState &state) const {
  if (state[0] == 0) {
    throw std::out_of_range("keep_evaluator: evaluation ended " +
                            std::to_string(state[2]) +
                            " element(s) short of index " +
                            std::to_string(index_));
  }
  return state[1];
}

std::string KeepIndexEvaluator::cache_key() const {
  return "keep_index" + std::to_string(index_);
}

SetComparison parse_set_comparison(const std::string &op) {
  if (op == "==") return SetComparison::Equal;
  if (op == "!=") return SetComparison::NotEqual;
  if (op == "<=") return SetComparison::LessEqual;
  if (op == "<") return SetComparison::Less;
  if (op == ">=") return SetComparison::GreaterEqual;
  if (op == ">") return SetComparison::Greater;
  if (op == "issubset") return SetComparison::IsSubset;
  if (op == "issuperset") return SetComparison::IsSuperset;
  if (op == "isdisjoint") return SetComparison::IsDisjoint;
  throw std::invalid_argument("comparison: unknown operator '" + op + "'");
}

// State: seen flag, has_any, has_all. The result is has_any && has_all,
// with `has_all` requiring every outcome to satisfy the weak condition and
// `has_any` some outcome to satisfy the strict one.
EvalState ComparisonEvaluator::initial_state(Order, const std::vector<Outcome> &,
                                             const std::vector<int> &) const {
  return {0, 0, 1};
}

std::optional<EvalState>
ComparisonEvaluator::next_state(const EvalState &state, Order, Outcome,
                                const std::vector<int> &counts) const {
  const int left = counts[0];
  const int right = counts[1];
  bool this_any = true;
  bool this_all = true;
  switch (op_) {
  case SetComparison::Less:
    this_any = left < right;
    this_all = left <= right;
    break;
  case SetComparison::LessEqual:
  case SetComparison::IsSubset:
    this_all = left <= right;
    break;
  case SetComparison::Greater:
    this_any = left > right;
    this_all = left >= right;
    break;
  case SetComparison::GreaterEqual:
  case SetComparison::IsSuperset:
    this_all = left >= right;
    break;
  case SetComparison::NotEqual:
    this_any = left != right;
    break;
  case SetComparison::Equal:
    this_all = left == right;
    break;
  case SetComparison::IsDisjoint:
    this_all = !(left > 0 && right > 0);
    break;
  }
  const bool has_all = state[2] != 0 && this_all;
  const bool has_any = has_all && (state[1] != 0 || this_any);
  return EvalState{1, has_any ? 1 : 0, has_all ? 1 : 0};
}

std::optional<bool>
ComparisonEvaluator::final_outcome(const EvalState &state) const {
  if (state[0] == 0) {
    switch (op_) {
    case SetComparison::Less:
    case SetComparison::Greater:
    case SetComparison::NotEqual:
      return false;
    default:
      return true;
    }
  }
  return state[1] != 0 && state[2] != 0;
}

std::string ComparisonEvaluator::cache_key() const {
  return "comparison" + std::to_string(static_cast<int>(op_));
}

CompairEvaluator::CompairEvaluator(CompairScores scores, Order order)
    : scores_(scores), order_(order) {
  if (order_ == Order::Any) {
    throw std::invalid_argument("compair: order must be ascending or descending");
  }
}

OrderPreference CompairEvaluator::order_preference() const {
  return {order_, OrderReason::Mandatory};
}

// State: score, advantage. Positive advantage is the number of left
// elements still waiting for a pair.
EvalState CompairEvaluator::initial_state(Order order,
                                          const std::vector<Outcome> &,
                                          const std::vector<int> &) const {
  if (order != order_) {
    throw UnsupportedOrder(std::string("compair: requires ") +
                           order_name(order_) + " order");
  }
  return {scores_.initial, 0};
}

std::optional<EvalState>
CompairEvaluator::next_state(const EvalState &state, Order, Outcome,
                             const std::vector<int> &counts) const {
  require_non_negative(counts, "compair");
  std::int64_t left = counts[0];
  std::int64_t right = counts[1];
  std::int64_t score = state[0];
  std::int64_t advantage = state[1];
  if (advantage > 0) {
    std::int64_t wins = std::min(advantage, right);
    score += wins * scores_.left;
    advantage -= wins;
    right -= wins;
  } else {
    std::int64_t wins = std::min(-advantage, left);
    score += wins * scores_.right;
    advantage += wins;
    left -= wins;
  }
  score += std::min(left, right) * scores_.tie;
  advantage += left - right;
  return EvalState{score, advantage};
}

std::optional<std::int64_t>
CompairEvaluator::final_outcome(const EvalState &state) const {
  std::int64_t score = state[0];
  if (state[1] > 0) {
    score += state[1] * scores_.extra_left;
  } else if (state[1] < 0) {
    score -= state[1] * scores_.extra_right;
  }
  return score;
}

std::string CompairEvaluator::cache_key() const {
  std::ostringstream key;
  key << "compair" << order_name(order_) << ':' << scores_.initial << ','
      << scores_.tie << ',' << scores_.left << ',' << scores_.right << ','
      << scores_.extra_left << ',' << scores_.extra_right;
  return key.str();
}

std::shared_ptr<const SumEvaluator> sum_evaluator() {
  return std::make_shared<const SumEvaluator>();
}

std::shared_ptr<const CountEvaluator> count_evaluator() {
  return std::make_shared<const CountEvaluator>();
}

std::shared_ptr<const AnyEvaluator> any_evaluator() {
  return std::make_shared<const AnyEvaluator>();
}

std::shared_ptr<const ExpandEvaluator> expand_evaluator() {
  return std::make_shared<const ExpandEvaluator>();
}

std::shared_ptr<const AllCountsEvaluator>
all_counts_evaluator(std::optional<int> min_count) {
  return std::make_shared<const AllCountsEvaluator>(min_count);
}

std::shared_ptr<const LargestCountEvaluator> largest_count_evaluator() {
  return std::make_shared<const LargestCountEvaluator>();
}

std::shared_ptr<const LargestStraightEvaluator> largest_straight_evaluator() {
  return std::make_shared<const LargestStraightEvaluator>();
}

std::shared_ptr<const HighestOutcomeAndCountEvaluator>
highest_outcome_and_count_evaluator() {
  return std::make_shared<const HighestOutcomeAndCountEvaluator>();
}

std::shared_ptr<const KeepIndexEvaluator> keep_evaluator(int index) {
  return std::make_shared<const KeepIndexEvaluator>(index);
}

std::shared_ptr<const ComparisonEvaluator>
comparison_evaluator(const std::string &op) {
  return std::make_shared<const ComparisonEvaluator>(parse_set_comparison(op));
}

std::shared_ptr<const CompairEvaluator> compair_evaluator(CompairScores scores,
                                                          Order order) {
  return std::make_shared<const CompairEvaluator>(scores, order);
}

} // namespace rollr
