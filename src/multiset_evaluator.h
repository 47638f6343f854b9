#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "counts.h"
#include "expression_program.h"
#include "logging.h"
#include "multiset_expression.h"
#include "order.h"
#include "types.h"

namespace rollr {

struct EvaluationOptions {
  bool use_cache{true};
  // Results kept per evaluator; the oldest entry is evicted first.
  int cache_limit{128};
  // Maximum number of worklist expansions; 0 means unbounded.
  std::uint64_t step_budget{0};
  Order forced_order{Order::Any};
  // Applied to the rollr logger when non-empty.
  std::string log_level;
};

struct CacheMetrics {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
};

// State machine folded over the outcomes of a multiset evaluation. States
// are flat integer vectors so that paths can be hashed and merged.
//
// next_state sees outcomes in the order they are popped: highest first when
// `order` is Descending, lowest first when Ascending. The engine picks the
// order from every preference in play (Descending by default), so an
// evaluator whose result depends on the direction must either handle both
// or declare a Mandatory order_preference.
class EvaluatorBase {
public:
  virtual ~EvaluatorBase() = default;

  // Number of counts consumed per outcome. Negative accepts any number.
  virtual int arity() const { return 1; }

  // Direction the fold must run in; see the class comment.
  virtual OrderPreference order_preference() const { return {}; }

  // `sizes` holds the element count of each input, -1 where unknown.
  virtual EvalState initial_state(Order order,
                                  const std::vector<Outcome> &outcomes,
                                  const std::vector<int> &sizes) const = 0;

  // Returns nullopt to reroll, which removes the path.
  virtual std::optional<EvalState>
  next_state(const EvalState &state, Order order, Outcome outcome,
             const std::vector<int> &counts) const = 0;

  // Outcomes that must be visited even when no input produces them.
  virtual std::vector<Outcome>
  extra_outcomes(const std::vector<Outcome> &outcomes) const {
    (void)outcomes;
    return {};
  }

  // Content key for result caching; empty disables caching.
  virtual std::string cache_key() const { return std::string(); }
};

struct PreparedEvaluation {
  ExpressionProgram program;
  std::string key;
  bool cacheable{false};
};

struct FoldResult {
  Order order{Order::Descending};
  std::vector<std::pair<EvalState, Weight>> finals;
  std::uint64_t steps{0};
};

// Compiles the inputs and checks them against the evaluator arity.
PreparedEvaluation prepare_evaluation(const EvaluatorBase &evaluator,
                                      const std::vector<ExpressionPtr> &inputs,
                                      const EvaluationOptions &options);

// Runs the outcome-by-outcome fold and returns the weighted final states.
FoldResult fold_evaluation(const EvaluatorBase &evaluator,
                           const PreparedEvaluation &prepared,
                           const EvaluationOptions &options);

template <typename R> class MultisetEvaluator : public EvaluatorBase {
public:
  using result_type = R;

  // Maps a final state to the result; nullopt rerolls the path.
  virtual std::optional<R> final_outcome(const EvalState &state) const = 0;

  Counts<R> evaluate(const std::vector<ExpressionPtr> &inputs,
                     const EvaluationOptions &options = {}) const {
    PreparedEvaluation prepared = prepare_evaluation(*this, inputs, options);
    const bool cached = options.use_cache && prepared.cacheable &&
                        options.cache_limit > 0;
    if (cached) {
      auto it = cache_.find(prepared.key);
      if (it != cache_.end()) {
        ++cache_metrics_.hits;
        logger()->debug("evaluate: cache hit");
        return it->second;
      }
      ++cache_metrics_.misses;
    }
    FoldResult folded = fold_evaluation(*this, prepared, options);
    std::vector<typename Counts<R>::item_type> items;
    items.reserve(folded.finals.size());
    for (auto &entry : folded.finals) {
      std::optional<R> outcome = final_outcome(entry.first);
      if (outcome) {
        items.emplace_back(std::move(*outcome), std::move(entry.second));
      }
    }
    Counts<R> result = Counts<R>::accumulate(std::move(items));
    if (cached) {
      store(prepared.key, result, static_cast<std::size_t>(options.cache_limit));
    }
    return result;
  }

  Counts<R> evaluate(const ExpressionPtr &input,
                     const EvaluationOptions &options = {}) const {
    return evaluate(std::vector<ExpressionPtr>{input}, options);
  }

  const CacheMetrics &cache_metrics() const { return cache_metrics_; }
  std::size_t cache_size() const { return cache_.size(); }
  void clear_cache() const {
    cache_.clear();
    cache_order_.clear();
  }

private:
  void store(const std::string &key, const Counts<R> &result,
             std::size_t limit) const {
    while (cache_order_.size() >= limit && !cache_order_.empty()) {
      cache_.erase(cache_order_.front());
      cache_order_.pop_front();
      ++cache_metrics_.evictions;
      logger()->debug("evaluate: evicted oldest cached result");
    }
    cache_.emplace(key, result);
    cache_order_.push_back(key);
  }

  mutable std::unordered_map<std::string, Counts<R>> cache_;
  mutable std::deque<std::string> cache_order_;
  mutable CacheMetrics cache_metrics_;
};

} // namespace rollr
