#pragma once

#include <Rcpp.h>

#include <string>

#include "multiset_evaluator.h"
#include "order.h"

namespace rollr {

inline bool has_field(const Rcpp::List &opts, const char *name) {
  return opts.containsElementNamed(name) && !Rf_isNull(opts[name]);
}

inline bool extract_flag(const Rcpp::List &opts, const char *name,
                         bool fallback) {
  if (!has_field(opts, name)) return fallback;
  Rcpp::LogicalVector value = opts[name];
  if (value.size() == 0 || Rcpp::LogicalVector::is_na(value[0])) {
    return fallback;
  }
  return value[0];
}

inline int extract_int(const Rcpp::List &opts, const char *name,
                       int fallback) {
  if (!has_field(opts, name)) return fallback;
  Rcpp::IntegerVector value = opts[name];
  if (value.size() == 0 || Rcpp::IntegerVector::is_na(value[0])) {
    return fallback;
  }
  return value[0];
}

inline std::string extract_string(const Rcpp::List &opts, const char *name,
                                  const std::string &fallback) {
  if (!has_field(opts, name)) return fallback;
  Rcpp::CharacterVector value = opts[name];
  if (value.size() == 0 || Rcpp::CharacterVector::is_na(value[0])) {
    return fallback;
  }
  return Rcpp::as<std::string>(value[0]);
}

inline Order parse_order(const std::string &name) {
  if (name == "ascending") return Order::Ascending;
  if (name == "descending") return Order::Descending;
  if (name == "any" || name.empty()) return Order::Any;
  Rcpp::stop("unknown order '%s'", name);
}

// Missing or NA fields keep their EvaluationOptions defaults.
inline EvaluationOptions extract_evaluation_options(
    Rcpp::Nullable<Rcpp::List> opts_in) {
  EvaluationOptions options;
  if (opts_in.isNull()) return options;
  Rcpp::List opts(opts_in);
  options.use_cache = extract_flag(opts, "use_cache", options.use_cache);
  options.cache_limit = extract_int(opts, "cache_limit", options.cache_limit);
  int budget = extract_int(opts, "step_budget", 0);
  if (budget < 0) {
    Rcpp::stop("step_budget must be non-negative");
  }
  options.step_budget = static_cast<std::uint64_t>(budget);
  options.forced_order = parse_order(extract_string(opts, "order", "any"));
  options.log_level = extract_string(opts, "log_level", "");
  return options;
}

} // namespace rollr
