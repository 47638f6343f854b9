#include "multiset_evaluator.h"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <boost/container_hash/hash.hpp>

#include "alignment.h"
#include "errors.h"
#include "logging.h"

namespace rollr {
namespace {

struct PathKey {
  std::vector<SourcePtr> sources;
  EvalState expression_state;
  EvalState evaluator_state;

  bool operator==(const PathKey &other) const {
    if (expression_state != other.expression_state ||
        evaluator_state != other.evaluator_state ||
        sources.size() != other.sources.size()) {
      return false;
    }
    SourcePtrEqual equal;
    for (std::size_t i = 0; i < sources.size(); ++i) {
      if (!equal(sources[i], other.sources[i])) {
        return false;
      }
    }
    return true;
  }
};

struct PathKeyHash {
  std::size_t operator()(const PathKey &key) const {
    std::size_t seed = 0;
    for (const auto &source : key.sources) {
      boost::hash_combine(seed, source->hash());
    }
    boost::hash_range(seed, key.expression_state.begin(),
                      key.expression_state.end());
    boost::hash_range(seed, key.evaluator_state.begin(),
                      key.evaluator_state.end());
    return seed;
  }
};

struct EvalStateHash {
  std::size_t operator()(const EvalState &state) const {
    return boost::hash_range(state.begin(), state.end());
  }
};

using Worklist = std::unordered_map<PathKey, Weight, PathKeyHash>;

std::optional<Outcome> next_outcome(const std::vector<SourcePtr> &sources,
                                    Order order) {
  std::optional<Outcome> best;
  for (const auto &source : sources) {
    std::optional<Outcome> candidate = source->extreme_outcome(order);
    if (!candidate) {
      continue;
    }
    if (!best || (order == Order::Ascending ? *candidate < *best
                                            : *candidate > *best)) {
      best = candidate;
    }
  }
  return best;
}

// Sources shared by the program, optionally followed by an alignment pad.
struct EvaluationSources {
  std::vector<SourcePtr> sources;
  std::vector<int> slot_begin;
  int slot_count{0};
  std::vector<Outcome> outcomes;
};

EvaluationSources collect_sources(const EvaluatorBase &evaluator,
                                  const ExpressionProgram &program) {
  EvaluationSources out;
  out.sources = program.sources;
  out.slot_begin = program.source_slot_begin;
  out.slot_count = program.source_slot_count;
  for (const auto &source : out.sources) {
    out.outcomes = sorted_union(out.outcomes, source->outcomes());
  }
  std::vector<Outcome> extra = evaluator.extra_outcomes(out.outcomes);
  std::sort(extra.begin(), extra.end());
  extra.erase(std::unique(extra.begin(), extra.end()), extra.end());
  if (!extra.empty()) {
    out.sources.push_back(make_alignment(extra));
    out.slot_begin.push_back(out.slot_count);
    out.slot_count += 1;
    out.outcomes = sorted_union(out.outcomes, extra);
  }
  return out;
}

FoldResult fold_in_order(const EvaluatorBase &evaluator,
                         const ExpressionProgram &program,
                         const EvaluationSources &inputs, Order order,
                         const EvaluationOptions &options) {
  // Throws UnsupportedOrder before any work is done.
  ExpressionRuntime runtime = initialize_expression_runtime(program, order);
  FoldResult result;
  result.order = order;

  Worklist pending;
  pending.emplace(PathKey{inputs.sources, runtime.initial_state,
                          evaluator.initial_state(order, inputs.outcomes,
                                                  runtime.output_sizes)},
                  Weight(1));
  std::unordered_map<EvalState, Weight, EvalStateHash> finals;

  std::unordered_map<std::string, std::vector<SourcePop>> pop_cache;
  std::vector<int> source_counts(static_cast<std::size_t>(inputs.slot_count));
  std::vector<std::int64_t> values;
  std::vector<int> outputs;
  std::vector<const std::vector<SourcePop> *> options_per_source;
  std::vector<std::size_t> odometer;

  while (!pending.empty()) {
    Worklist next;
    pop_cache.clear();
    for (auto &entry : pending) {
      const PathKey &path = entry.first;
      const Weight &path_weight = entry.second;
      std::optional<Outcome> outcome = next_outcome(path.sources, order);
      if (!outcome) {
        finals[path.evaluator_state] += path_weight;
        continue;
      }

      options_per_source.clear();
      for (const auto &source : path.sources) {
        std::string pop_key = source->key();
        pop_key += '@';
        pop_key += std::to_string(*outcome);
        auto cached = pop_cache.find(pop_key);
        if (cached == pop_cache.end()) {
          cached =
              pop_cache.emplace(pop_key, source->pop(order, *outcome)).first;
        }
        options_per_source.push_back(&cached->second);
      }
      if (std::any_of(options_per_source.begin(), options_per_source.end(),
                      [](const std::vector<SourcePop> *pops) {
                        return pops->empty();
                      })) {
        continue;
      }

      odometer.assign(path.sources.size(), 0);
      while (true) {
        ++result.steps;
        if (options.step_budget > 0 && result.steps > options.step_budget) {
          throw EvaluationBudgetExceeded(
              "evaluate: exceeded the step budget of " +
              std::to_string(options.step_budget));
        }
        Weight weight = path_weight;
        std::vector<SourcePtr> next_sources;
        next_sources.reserve(path.sources.size());
        for (std::size_t i = 0; i < path.sources.size(); ++i) {
          const SourcePop &pop = (*options_per_source[i])[odometer[i]];
          if (path.sources[i]->kind() != SourceKind::Alignment) {
            weight *= pop.weight;
          }
          next_sources.push_back(pop.next);
          const int begin = inputs.slot_begin[i];
          for (std::size_t k = 0; k < pop.counts.size(); ++k) {
            source_counts[static_cast<std::size_t>(begin) + k] = pop.counts[k];
          }
        }

        if (weight != 0) {
          EvalState expression_state = path.expression_state;
          step_expression(program, runtime, expression_state, *outcome,
                          source_counts, values, outputs);
          std::optional<EvalState> evaluator_state = evaluator.next_state(
              path.evaluator_state, order, *outcome, outputs);
          if (evaluator_state) {
            next[PathKey{std::move(next_sources), std::move(expression_state),
                         std::move(*evaluator_state)}] += weight;
          }
        }

        std::size_t digit = 0;
        while (digit < odometer.size()) {
          if (++odometer[digit] < options_per_source[digit]->size()) {
            break;
          }
          odometer[digit] = 0;
          ++digit;
        }
        if (digit == odometer.size()) {
          break;
        }
      }
    }
    if (!next.empty()) {
      logger()->trace("evaluate: {} live paths", next.size());
    }
    pending = std::move(next);
  }

  result.finals.reserve(finals.size());
  for (auto &entry : finals) {
    result.finals.emplace_back(entry.first, std::move(entry.second));
  }
  return result;
}

} // namespace

PreparedEvaluation prepare_evaluation(const EvaluatorBase &evaluator,
                                      const std::vector<ExpressionPtr> &inputs,
                                      const EvaluationOptions &options) {
  if (!options.log_level.empty()) {
    set_log_level(options.log_level);
  }
  PreparedEvaluation prepared;
  prepared.program = compile_expression_program(inputs);
  const int arity = evaluator.arity();
  const int supplied = static_cast<int>(prepared.program.outputs.size());
  if (arity >= 0 && supplied != arity) {
    throw MultisetArityError("evaluate: evaluator takes " +
                             std::to_string(arity) + " multisets, got " +
                             std::to_string(supplied));
  }
  std::string evaluator_key = evaluator.cache_key();
  prepared.cacheable = prepared.program.cacheable && !evaluator_key.empty();
  if (prepared.cacheable) {
    std::ostringstream key;
    key << order_name(options.forced_order) << '#' << prepared.program.key
        << '#' << evaluator_key;
    for (const auto &source : prepared.program.sources) {
      key << '#' << source->key();
    }
    prepared.key = key.str();
  }
  return prepared;
}

FoldResult fold_evaluation(const EvaluatorBase &evaluator,
                           const PreparedEvaluation &prepared,
                           const EvaluationOptions &options) {
  const ExpressionProgram &program = prepared.program;
  for (const auto &source : program.sources) {
    if (!source->is_resolvable()) {
      logger()->debug("evaluate: unresolvable source, empty result");
      return FoldResult{};
    }
  }
  EvaluationSources inputs = collect_sources(evaluator, program);

  if (options.forced_order != Order::Any) {
    logger()->debug("evaluate: forced {} order", order_name(options.forced_order));
    return fold_in_order(evaluator, program, inputs, options.forced_order,
                         options);
  }

  std::vector<OrderPreference> preferences;
  preferences.push_back({Order::Descending, OrderReason::Default});
  for (const auto &source : program.sources) {
    preferences.push_back(source->order_preference());
  }
  preferences.push_back(program.order_preference);
  preferences.push_back(evaluator.order_preference());
  OrderPreference merged = merge_order_preferences(preferences);
  const Order order =
      merged.order == Order::Any ? Order::Descending : merged.order;
  logger()->debug("evaluate: {} order ({}), {} sources, {} ops",
                  order_name(order), order_reason_name(merged.reason),
                  inputs.sources.size(), program.ops.size());

  try {
    FoldResult result = fold_in_order(evaluator, program, inputs, order, options);
    logger()->debug("evaluate: {} steps, {} final states", result.steps,
                    result.finals.size());
    return result;
  } catch (const UnsupportedOrder &e) {
    if (merged.order != Order::Any && merged.reason > OrderReason::Default) {
      throw ConflictingOrderError(std::string("evaluate: ") + e.what() +
                                  " but " + order_name(order) + " order is " +
                                  order_reason_name(merged.reason));
    }
    logger()->debug("evaluate: {}; retrying in {} order", e.what(),
                    order_name(opposite_order(order)));
  }
  try {
    return fold_in_order(evaluator, program, inputs, opposite_order(order),
                         options);
  } catch (const UnsupportedOrder &e) {
    throw ConflictingOrderError(
        std::string("evaluate: no order satisfies every operation: ") +
        e.what());
  }
}

} // namespace rollr
