#pragma once

#include <stdexcept>
#include <string>

namespace rollr {

class MultisetArityError : public std::invalid_argument {
public:
  explicit MultisetArityError(const std::string &what)
      : std::invalid_argument(what) {}
};

class MultisetBindingError : public std::invalid_argument {
public:
  explicit MultisetBindingError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Raised by an expression node that cannot run in the requested order.
class UnsupportedOrder : public std::runtime_error {
public:
  explicit UnsupportedOrder(const std::string &what)
      : std::runtime_error(what) {}
};

class ConflictingOrderError : public std::runtime_error {
public:
  explicit ConflictingOrderError(const std::string &what)
      : std::runtime_error(what) {}
};

class EvaluationBudgetExceeded : public std::runtime_error {
public:
  explicit EvaluationBudgetExceeded(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace rollr
