// [[Rcpp::depends(Rcpp, RcppParallel, BH)]]
// [[Rcpp::plugins(cpp17)]]
#include <Rcpp.h>
#include <RcppParallel.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "again.h"
#include "deal.h"
#include "evaluators.h"
#include "keep_tuple.h"
#include "multiset_expression.h"
#include "pool.h"
#include "r_options.hpp"

namespace {

using rollr::Die;
using rollr::Outcome;

Die die_from_faces(const Rcpp::IntegerVector &faces) {
  std::vector<rollr::DieEntry> entries;
  entries.reserve(static_cast<std::size_t>(faces.size()));
  for (R_xlen_t i = 0; i < faces.size(); ++i) {
    if (Rcpp::IntegerVector::is_na(faces[i])) {
      Rcpp::stop("die faces cannot be NA");
    }
    entries.emplace_back(static_cast<Outcome>(faces[i]));
  }
  return rollr::make_die(entries);
}

std::vector<Die> dice_from_list(const Rcpp::List &dice) {
  std::vector<Die> out;
  out.reserve(static_cast<std::size_t>(dice.size()));
  for (R_xlen_t i = 0; i < dice.size(); ++i) {
    out.push_back(die_from_faces(Rcpp::as<Rcpp::IntegerVector>(dice[i])));
  }
  return out;
}

rollr::KeepSequence keep_from_vector(const Rcpp::IntegerVector &keep) {
  rollr::KeepSequence out;
  out.reserve(static_cast<std::size_t>(keep.size()));
  for (R_xlen_t i = 0; i < keep.size(); ++i) {
    if (Rcpp::IntegerVector::is_na(keep[i])) {
      out.push_back(rollr::kEllipsis);
    } else {
      out.push_back(static_cast<int>(keep[i]));
    }
  }
  return out;
}

rollr::PoolPtr build_pool(const Rcpp::List &dice,
                          Rcpp::Nullable<Rcpp::IntegerVector> keep) {
  rollr::PoolPtr pool = rollr::make_pool(dice_from_list(dice));
  if (keep.isNotNull()) {
    pool = pool->keep(keep_from_vector(Rcpp::IntegerVector(keep)));
  }
  return pool;
}

// Weights leave as decimal strings so that no precision is lost.
Rcpp::List counts_to_list(const rollr::Counts<Outcome> &counts) {
  Rcpp::NumericVector outcomes(counts.size());
  Rcpp::CharacterVector weights(counts.size());
  for (std::size_t i = 0; i < counts.size(); ++i) {
    outcomes[i] = static_cast<double>(counts.key(i));
    weights[i] = counts.value(i).str();
  }
  return Rcpp::List::create(Rcpp::Named("outcomes") = outcomes,
                            Rcpp::Named("weights") = weights);
}

rollr::Counts<Outcome> as_outcome_counts(const rollr::Counts<bool> &counts) {
  std::vector<rollr::Counts<Outcome>::item_type> pairs;
  for (const auto &item : counts.items()) {
    pairs.emplace_back(item.first ? 1 : 0, item.second);
  }
  return rollr::Counts<Outcome>::from_pairs(std::move(pairs));
}

rollr::Counts<Outcome> evaluate_named(const std::string &name,
                                      const rollr::ExpressionPtr &input,
                                      const rollr::EvaluationOptions &options) {
  if (name == "sum") return rollr::sum_evaluator()->evaluate(input, options);
  if (name == "count") return rollr::count_evaluator()->evaluate(input, options);
  if (name == "largest_count") {
    return rollr::largest_count_evaluator()->evaluate(input, options);
  }
  if (name == "largest_straight") {
    return rollr::largest_straight_evaluator()->evaluate(input, options);
  }
  if (name == "any") {
    return as_outcome_counts(rollr::any_evaluator()->evaluate(input, options));
  }
  Rcpp::stop("unknown evaluator '%s'", name);
}

struct PoolSumWorker : public RcppParallel::Worker {
  const std::vector<rollr::PoolPtr> *pools;
  const rollr::EvaluationOptions *options;
  std::vector<rollr::Counts<Outcome>> *results;
  std::vector<std::string> *errors;

  PoolSumWorker(const std::vector<rollr::PoolPtr> &pools_,
                const rollr::EvaluationOptions &options_,
                std::vector<rollr::Counts<Outcome>> &results_,
                std::vector<std::string> &errors_)
      : pools(&pools_), options(&options_), results(&results_),
        errors(&errors_) {}

  void operator()(std::size_t begin, std::size_t end) {
    // One evaluator per chunk: caches are never shared between threads.
    rollr::SumEvaluator evaluator;
    for (std::size_t i = begin; i < end; ++i) {
      try {
        (*results)[i] =
            evaluator.evaluate(rollr::source_expression((*pools)[i]), *options);
      } catch (const std::exception &e) {
        (*errors)[i] = e.what();
      }
    }
  }
};

} // namespace

//' Exact distribution of the sum of a pool
//' @noRd
// [[Rcpp::export]]
Rcpp::List rollr_pool_sum(Rcpp::List dice,
                          Rcpp::Nullable<Rcpp::IntegerVector> keep = R_NilValue,
                          Rcpp::Nullable<Rcpp::List> opts = R_NilValue) {
  rollr::EvaluationOptions options = rollr::extract_evaluation_options(opts);
  rollr::PoolPtr pool = build_pool(dice, keep);
  return counts_to_list(
      rollr::sum_evaluator()->evaluate(rollr::source_expression(pool), options));
}

//' @noRd
// [[Rcpp::export]]
Rcpp::List rollr_pool_evaluate(Rcpp::List dice, std::string evaluator,
                               Rcpp::Nullable<Rcpp::IntegerVector> keep = R_NilValue,
                               Rcpp::Nullable<Rcpp::List> opts = R_NilValue) {
  rollr::EvaluationOptions options = rollr::extract_evaluation_options(opts);
  rollr::PoolPtr pool = build_pool(dice, keep);
  return counts_to_list(
      evaluate_named(evaluator, rollr::source_expression(pool), options));
}

//' @noRd
// [[Rcpp::export]]
Rcpp::List rollr_deal_evaluate(Rcpp::IntegerVector ranks, int times,
                               Rcpp::IntegerVector hand_sizes,
                               std::string evaluator, int hand = 0,
                               Rcpp::Nullable<Rcpp::List> opts = R_NilValue) {
  rollr::EvaluationOptions options = rollr::extract_evaluation_options(opts);
  std::vector<Outcome> rank_values(ranks.begin(), ranks.end());
  Die deck = rollr::make_deck(rank_values, times);
  std::vector<int> sizes(hand_sizes.begin(), hand_sizes.end());
  rollr::DealPtr deal = rollr::make_deal(deck, sizes);
  return counts_to_list(
      evaluate_named(evaluator, rollr::hand_expression(deal, hand), options));
}

//' @noRd
// [[Rcpp::export]]
Rcpp::List rollr_explode(Rcpp::IntegerVector faces,
                         Rcpp::Nullable<Rcpp::IntegerVector> targets = R_NilValue,
                         int depth = 9) {
  std::vector<Outcome> target_values;
  if (targets.isNotNull()) {
    Rcpp::IntegerVector t(targets);
    target_values.assign(t.begin(), t.end());
  }
  return counts_to_list(
      rollr::explode(die_from_faces(faces), target_values, depth));
}

//' Keep tuple for a pool of `size` dice; NA entries act as an ellipsis
//' @noRd
// [[Rcpp::export]]
Rcpp::IntegerVector rollr_keep_tuple(int size, Rcpp::IntegerVector index) {
  std::vector<int> tuple;
  if (index.size() == 1 && !Rcpp::IntegerVector::is_na(index[0])) {
    tuple = rollr::make_keep_tuple(size, static_cast<int>(index[0]));
  } else {
    tuple = rollr::make_keep_tuple(size, keep_from_vector(index));
  }
  return Rcpp::IntegerVector(tuple.begin(), tuple.end());
}

//' @noRd
// [[Rcpp::export]]
Rcpp::List rollr_pool_sum_batch(Rcpp::List pools,
                                Rcpp::Nullable<Rcpp::List> opts = R_NilValue) {
  rollr::EvaluationOptions options = rollr::extract_evaluation_options(opts);
  const std::size_t n = static_cast<std::size_t>(pools.size());
  std::vector<rollr::PoolPtr> built;
  built.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    built.push_back(build_pool(Rcpp::as<Rcpp::List>(pools[i]), R_NilValue));
  }
  std::vector<rollr::Counts<Outcome>> results(n);
  std::vector<std::string> errors(n);
  PoolSumWorker worker(built, options, results, errors);
#if defined(RCPP_PARALLEL_USE_TBB) && RCPP_PARALLEL_USE_TBB
  RcppParallel::parallelFor(0, n, worker);
#else
  worker(0, n);
#endif
  Rcpp::List out(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (!errors[i].empty()) {
      Rcpp::stop("pool %d: %s", static_cast<int>(i + 1), errors[i]);
    }
    out[i] = counts_to_list(results[i]);
  }
  return out;
}
