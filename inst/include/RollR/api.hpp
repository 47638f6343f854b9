#pragma once

#include <Rcpp.h>
#include <R_ext/Rdynload.h>

#include <string>

namespace rollr_api {

using pool_sum_ccallable_t = SEXP (*)(SEXP, SEXP, SEXP);
using pool_evaluate_ccallable_t = SEXP (*)(SEXP, SEXP, SEXP, SEXP);

inline pool_sum_ccallable_t pool_sum_ccallable() {
  static pool_sum_ccallable_t fn = nullptr;
  if (!fn) {
    fn = reinterpret_cast<pool_sum_ccallable_t>(
      R_GetCCallable("RollR", "pool_sum"));
    if (!fn) {
      Rcpp::stop("RollR C-callable 'pool_sum' not found (is RollR loaded?)");
    }
  }
  return fn;
}

inline pool_evaluate_ccallable_t pool_evaluate_ccallable() {
  static pool_evaluate_ccallable_t fn = nullptr;
  if (!fn) {
    fn = reinterpret_cast<pool_evaluate_ccallable_t>(
      R_GetCCallable("RollR", "pool_evaluate"));
    if (!fn) {
      Rcpp::stop("RollR C-callable 'pool_evaluate' not found (is RollR loaded?)");
    }
  }
  return fn;
}

// Returns list(outcomes = <numeric>, weights = <character>).
inline Rcpp::List pool_sum(const Rcpp::List& dice,
                           SEXP keep = R_NilValue,
                           SEXP opts = R_NilValue) {
  return Rcpp::as<Rcpp::List>(pool_sum_ccallable()(dice, keep, opts));
}

inline Rcpp::List pool_evaluate(const Rcpp::List& dice,
                                const std::string& evaluator,
                                SEXP keep = R_NilValue,
                                SEXP opts = R_NilValue) {
  return Rcpp::as<Rcpp::List>(
    pool_evaluate_ccallable()(dice, Rcpp::wrap(evaluator), keep, opts));
}

} // namespace rollr_api
