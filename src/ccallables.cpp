#include <Rcpp.h>
#include <R_ext/Rdynload.h>

#include <string>

// Cross-package C-callables (R_RegisterCCallable / R_GetCCallable) so that
// other packages can reach the evaluation entry points from C++ without R
// dispatch. Consumers include inst/include/RollR/api.hpp.

// Implemented in src/rollr_exports.cpp
Rcpp::List rollr_pool_sum(Rcpp::List dice,
                          Rcpp::Nullable<Rcpp::IntegerVector> keep,
                          Rcpp::Nullable<Rcpp::List> opts);

Rcpp::List rollr_pool_evaluate(Rcpp::List dice, std::string evaluator,
                               Rcpp::Nullable<Rcpp::IntegerVector> keep,
                               Rcpp::Nullable<Rcpp::List> opts);

extern "C" {

SEXP rollr_pool_sum_ccallable(SEXP diceSEXP, SEXP keepSEXP, SEXP optsSEXP) {
  BEGIN_RCPP
  Rcpp::List dice(diceSEXP);
  Rcpp::Nullable<Rcpp::IntegerVector> keep(keepSEXP);
  Rcpp::Nullable<Rcpp::List> opts(optsSEXP);
  return rollr_pool_sum(dice, keep, opts);
  END_RCPP
}

SEXP rollr_pool_evaluate_ccallable(SEXP diceSEXP, SEXP evaluatorSEXP,
                                   SEXP keepSEXP, SEXP optsSEXP) {
  BEGIN_RCPP
  Rcpp::List dice(diceSEXP);
  std::string evaluator = Rcpp::as<std::string>(evaluatorSEXP);
  Rcpp::Nullable<Rcpp::IntegerVector> keep(keepSEXP);
  Rcpp::Nullable<Rcpp::List> opts(optsSEXP);
  return rollr_pool_evaluate(dice, evaluator, keep, opts);
  END_RCPP
}

} // extern "C"

// [[Rcpp::export]]
SEXP register_ccallables_cpp() {
  static bool registered = false;
  if (registered) return R_NilValue;

  R_RegisterCCallable("RollR", "pool_sum",
                      reinterpret_cast<DL_FUNC>(rollr_pool_sum_ccallable));
  R_RegisterCCallable("RollR", "pool_evaluate",
                      reinterpret_cast<DL_FUNC>(rollr_pool_evaluate_ccallable));

  registered = true;
  return R_NilValue;
}
