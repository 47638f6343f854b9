#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "multiset_evaluator.h"

namespace rollr {

// Sum of outcome * count over all outcomes.
class SumEvaluator : public MultisetEvaluator<Outcome> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<Outcome> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override { return "sum"; }
};

// Total number of elements.
class CountEvaluator : public MultisetEvaluator<Outcome> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<Outcome> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override { return "count"; }
};

// Whether any outcome has a positive count.
class AnyEvaluator : public MultisetEvaluator<bool> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<bool> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override { return "any"; }
};

// The elements as an ascending sequence.
class ExpandEvaluator : public MultisetEvaluator<std::vector<Outcome>> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<std::vector<Outcome>>
  final_outcome(const EvalState &state) const override;
  std::string cache_key() const override { return "expand"; }
};

// Counts at or above `min_count` sorted descending; nullopt keeps every
// outcome of the domain, including zero counts.
class AllCountsEvaluator : public MultisetEvaluator<std::vector<std::int64_t>> {
public:
  explicit AllCountsEvaluator(std::optional<int> min_count = 1)
      : min_count_(min_count) {}

  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<std::vector<std::int64_t>>
  final_outcome(const EvalState &state) const override;
  std::vector<Outcome>
  extra_outcomes(const std::vector<Outcome> &outcomes) const override;
  std::string cache_key() const override;

private:
  std::optional<int> min_count_;
};

class LargestCountEvaluator : public MultisetEvaluator<Outcome> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<Outcome> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override { return "largest_count"; }
};

// Length of the longest run of consecutive outcomes with positive counts.
class LargestStraightEvaluator : public MultisetEvaluator<Outcome> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<Outcome> final_outcome(const EvalState &state) const override;
  std::vector<Outcome>
  extra_outcomes(const std::vector<Outcome> &outcomes) const override;
  std::string cache_key() const override { return "largest_straight"; }
};

// Highest outcome with a positive count and that count; (lowest outcome, 0)
// when every count is zero.
class HighestOutcomeAndCountEvaluator
    : public MultisetEvaluator<std::pair<Outcome, std::int64_t>> {
public:
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<std::pair<Outcome, std::int64_t>>
  final_outcome(const EvalState &state) const override;
  std::vector<Outcome>
  extra_outcomes(const std::vector<Outcome> &outcomes) const override;
  std::string cache_key() const override { return "highest_outcome_and_count"; }
};

// The outcome at a sorted index. Non-negative indices count from the lowest
// element, negative ones from the highest.
class KeepIndexEvaluator : public MultisetEvaluator<Outcome> {
public:
  explicit KeepIndexEvaluator(int index) : index_(index) {}

  OrderPreference order_preference() const override;
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<Outcome> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override;

private:
  int index_;
};

enum class SetComparison : std::uint8_t {
  Equal = 0,
  NotEqual = 1,
  LessEqual = 2,
  Less = 3,
  GreaterEqual = 4,
  Greater = 5,
  IsSubset = 6,
  IsSuperset = 7,
  IsDisjoint = 8
};

// Parses "==", "!=", "<=", "<", ">=", ">", "issubset", "issuperset" or
// "isdisjoint".
SetComparison parse_set_comparison(const std::string &op);

// Compares the first multiset against the second as multisets.
class ComparisonEvaluator : public MultisetEvaluator<bool> {
public:
  explicit ComparisonEvaluator(SetComparison op) : op_(op) {}

  int arity() const override { return 2; }
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<bool> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override;

private:
  SetComparison op_;
};

struct CompairScores {
  std::int64_t initial{0};
  std::int64_t tie{0};
  std::int64_t left{0};
  std::int64_t right{0};
  std::int64_t extra_left{0};
  std::int64_t extra_right{0};
};

// Pairs the sorted elements of two multisets and scores each pair. In
// descending order the higher element wins; in ascending the lower.
class CompairEvaluator : public MultisetEvaluator<std::int64_t> {
public:
  explicit CompairEvaluator(CompairScores scores,
                            Order order = Order::Descending);

  int arity() const override { return 2; }
  OrderPreference order_preference() const override;
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override;
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override;
  std::optional<std::int64_t> final_outcome(const EvalState &state) const override;
  std::string cache_key() const override;

private:
  CompairScores scores_;
  Order order_;
};

// Evaluator assembled from callables. Results are never cached.
template <typename R> class FunctionEvaluator : public MultisetEvaluator<R> {
public:
  using InitialFn = std::function<EvalState(
      Order, const std::vector<Outcome> &, const std::vector<int> &)>;
  using NextFn = std::function<std::optional<EvalState>(
      const EvalState &, Order, Outcome, const std::vector<int> &)>;
  using FinalFn = std::function<std::optional<R>(const EvalState &)>;

  FunctionEvaluator(InitialFn initial, NextFn next, FinalFn final_fn,
                    int arity = 1, OrderPreference order = {})
      : initial_(std::move(initial)), next_(std::move(next)),
        final_(std::move(final_fn)), arity_(arity), order_(order) {
    if (!initial_ || !next_ || !final_) {
      throw std::invalid_argument("function_evaluator: empty callable");
    }
  }

  int arity() const override { return arity_; }
  OrderPreference order_preference() const override { return order_; }
  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override {
    return initial_(order, outcomes, sizes);
  }
  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override {
    return next_(state, order, outcome, counts);
  }
  std::optional<R> final_outcome(const EvalState &state) const override {
    return final_(state);
  }

private:
  InitialFn initial_;
  NextFn next_;
  FinalFn final_;
  int arity_;
  OrderPreference order_;
};

// Runs several evaluators over the same inputs. The joint state stores each
// member state prefixed by its length.
template <typename R> class JointEvaluator : public MultisetEvaluator<std::vector<R>> {
public:
  using Member = std::shared_ptr<const MultisetEvaluator<R>>;

  explicit JointEvaluator(std::vector<Member> members)
      : members_(std::move(members)) {
    if (members_.empty()) {
      throw std::invalid_argument("joint: no evaluators");
    }
    arity_ = -1;
    for (const auto &member : members_) {
      if (!member) {
        throw std::invalid_argument("joint: null evaluator");
      }
      if (member->arity() < 0) {
        continue;
      }
      if (arity_ >= 0 && arity_ != member->arity()) {
        throw MultisetArityError("joint: evaluators disagree on arity");
      }
      arity_ = member->arity();
    }
  }

  int arity() const override { return arity_; }

  OrderPreference order_preference() const override {
    std::vector<OrderPreference> preferences;
    for (const auto &member : members_) {
      preferences.push_back(member->order_preference());
    }
    return merge_order_preferences(preferences);
  }

  EvalState initial_state(Order order, const std::vector<Outcome> &outcomes,
                          const std::vector<int> &sizes) const override {
    std::vector<EvalState> parts;
    for (const auto &member : members_) {
      parts.push_back(member->initial_state(order, outcomes, sizes));
    }
    return join(parts);
  }

  std::optional<EvalState> next_state(const EvalState &state, Order order,
                                      Outcome outcome,
                                      const std::vector<int> &counts) const override {
    std::vector<EvalState> parts = split(state);
    for (std::size_t i = 0; i < members_.size(); ++i) {
      std::optional<EvalState> next =
          members_[i]->next_state(parts[i], order, outcome, counts);
      if (!next) {
        return std::nullopt;
      }
      parts[i] = std::move(*next);
    }
    return join(parts);
  }

  std::optional<std::vector<R>> final_outcome(const EvalState &state) const override {
    std::vector<EvalState> parts = split(state);
    std::vector<R> out;
    out.reserve(members_.size());
    for (std::size_t i = 0; i < members_.size(); ++i) {
      std::optional<R> value = members_[i]->final_outcome(parts[i]);
      if (!value) {
        return std::nullopt;
      }
      out.push_back(std::move(*value));
    }
    return out;
  }

  std::vector<Outcome>
  extra_outcomes(const std::vector<Outcome> &outcomes) const override {
    std::vector<Outcome> out;
    for (const auto &member : members_) {
      std::vector<Outcome> extra = member->extra_outcomes(outcomes);
      std::sort(extra.begin(), extra.end());
      out = sorted_union(out, extra);
    }
    return out;
  }

  std::string cache_key() const override {
    std::string key = "joint(";
    for (const auto &member : members_) {
      std::string member_key = member->cache_key();
      if (member_key.empty()) {
        return std::string();
      }
      key += member_key;
      key += ';';
    }
    key += ')';
    return key;
  }

private:
  static EvalState join(const std::vector<EvalState> &parts) {
    EvalState out;
    for (const auto &part : parts) {
      out.push_back(static_cast<std::int64_t>(part.size()));
      out.insert(out.end(), part.begin(), part.end());
    }
    return out;
  }

  std::vector<EvalState> split(const EvalState &state) const {
    std::vector<EvalState> parts;
    parts.reserve(members_.size());
    std::size_t pos = 0;
    for (std::size_t i = 0; i < members_.size(); ++i) {
      std::size_t width = static_cast<std::size_t>(state.at(pos));
      parts.emplace_back(state.begin() + static_cast<std::ptrdiff_t>(pos + 1),
                         state.begin() +
                             static_cast<std::ptrdiff_t>(pos + 1 + width));
      pos += 1 + width;
    }
    return parts;
  }

  std::vector<Member> members_;
  int arity_{1};
};

std::shared_ptr<const SumEvaluator> sum_evaluator();
std::shared_ptr<const CountEvaluator> count_evaluator();
std::shared_ptr<const AnyEvaluator> any_evaluator();
std::shared_ptr<const ExpandEvaluator> expand_evaluator();
std::shared_ptr<const AllCountsEvaluator>
all_counts_evaluator(std::optional<int> min_count = 1);
std::shared_ptr<const LargestCountEvaluator> largest_count_evaluator();
std::shared_ptr<const LargestStraightEvaluator> largest_straight_evaluator();
std::shared_ptr<const HighestOutcomeAndCountEvaluator>
highest_outcome_and_count_evaluator();
std::shared_ptr<const KeepIndexEvaluator> keep_evaluator(int index);
std::shared_ptr<const ComparisonEvaluator>
comparison_evaluator(const std::string &op);
std::shared_ptr<const CompairEvaluator>
compair_evaluator(CompairScores scores, Order order = Order::Descending);

template <typename R>
std::shared_ptr<const FunctionEvaluator<R>> function_evaluator(
    typename FunctionEvaluator<R>::InitialFn initial,
    typename FunctionEvaluator<R>::NextFn next,
    typename FunctionEvaluator<R>::FinalFn final_fn, int arity = 1,
    OrderPreference order = {}) {
  return std::make_shared<const FunctionEvaluator<R>>(
      std::move(initial), std::move(next), std::move(final_fn), arity, order);
}

template <typename R>
std::shared_ptr<const JointEvaluator<R>>
joint_evaluator(std::vector<std::shared_ptr<const MultisetEvaluator<R>>> members) {
  return std::make_shared<const JointEvaluator<R>>(std::move(members));
}

} // namespace rollr
