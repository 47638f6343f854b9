#include "multiset_function.h"

#include <cstddef>
#include <string>

namespace rollr {

std::vector<ExpressionPtr> make_multiset_variables(int arity) {
  std::vector<ExpressionPtr> out;
  out.reserve(static_cast<std::size_t>(arity));
  for (int i = 0; i < arity; ++i) {
    out.push_back(multiset_variable(i));
  }
  return out;
}

std::vector<ExpressionPtr>
bind_multiset_variables(int arity, const std::vector<ExpressionPtr> &body,
                        const std::vector<ExpressionPtr> &inputs) {
  if (static_cast<int>(inputs.size()) != arity) {
    throw MultisetArityError("multiset_function: expected " +
                             std::to_string(arity) + " inputs, got " +
                             std::to_string(inputs.size()));
  }
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (!inputs[i]) {
      throw std::invalid_argument("multiset_function: null input");
    }
    if (expression_arity(inputs[i]) != 1) {
      throw MultisetBindingError("multiset_function: input " +
                                 std::to_string(i) +
                                 " feeds more than one count");
    }
  }
  std::vector<ExpressionPtr> out;
  out.reserve(body.size());
  for (const auto &expression : body) {
    out.push_back(substitute_variables(expression, inputs));
  }
  return out;
}

} // namespace rollr
