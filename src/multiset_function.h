#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.h"
#include "multiset_evaluator.h"
#include "multiset_expression.h"

namespace rollr {

// Fresh variables 0..arity-1.
std::vector<ExpressionPtr> make_multiset_variables(int arity);

// Substitutes `inputs` for the variables of `body`. Every input must feed a
// single count.
std::vector<ExpressionPtr>
bind_multiset_variables(int arity, const std::vector<ExpressionPtr> &body,
                        const std::vector<ExpressionPtr> &inputs);

template <typename R> struct MultisetFunctionBody {
  std::vector<ExpressionPtr> expressions;
  std::shared_ptr<const MultisetEvaluator<R>> evaluator;
};

// Evaluation written against symbolic multiset variables. The callable runs
// once, at construction, and its expressions are rebound on every call.
template <typename R> class MultisetFunction {
public:
  using Definition =
      std::function<MultisetFunctionBody<R>(const std::vector<ExpressionPtr> &)>;

  MultisetFunction(int arity, const Definition &definition) : arity_(arity) {
    if (arity_ < 0) {
      throw std::invalid_argument("multiset_function: negative arity");
    }
    body_ = definition(make_multiset_variables(arity_));
    if (!body_.evaluator) {
      throw std::invalid_argument("multiset_function: no evaluator returned");
    }
  }

  int arity() const { return arity_; }

  Counts<R> evaluate(const std::vector<ExpressionPtr> &inputs,
                     const EvaluationOptions &options = {}) const {
    return body_.evaluator->evaluate(
        bind_multiset_variables(arity_, body_.expressions, inputs), options);
  }

private:
  int arity_;
  MultisetFunctionBody<R> body_;
};

} // namespace rollr
