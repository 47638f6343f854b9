#include "multiset_expression.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "errors.h"

namespace rollr {
namespace {

void require_unary(const ExpressionPtr &operand, const char *name) {
  if (!operand) {
    throw std::invalid_argument(std::string(name) + ": null operand");
  }
  if (expression_arity(operand) != 1) {
    throw MultisetArityError(std::string(name) +
                             ": operands must feed exactly one count");
  }
}

std::shared_ptr<MultisetExpression>
make_node(ExpressionOp op, std::vector<ExpressionPtr> children,
          const char *name) {
  for (const auto &child : children) {
    require_unary(child, name);
  }
  auto node = std::make_shared<MultisetExpression>();
  node->op = op;
  node->children = std::move(children);
  return node;
}

std::vector<int> ones(int n) {
  return std::vector<int>(static_cast<std::size_t>(std::max(n, 0)), 1);
}

std::vector<int> zeros_then_ones(int zeros, int n) {
  std::vector<int> out(static_cast<std::size_t>(std::max(zeros, 0)), 0);
  std::vector<int> tail = ones(n);
  out.insert(out.end(), tail.begin(), tail.end());
  return out;
}

ExpressionPtr make_keep_node(const ExpressionPtr &operand, Order keep_order,
                             std::vector<int> keep_tuple, int drop) {
  auto node = make_node(ExpressionOp::Keep, {operand}, "keep");
  node->keep_order = keep_order;
  node->keep_tuple = std::move(keep_tuple);
  node->drop = drop;
  return node;
}

ExpressionPtr keep_slice(const ExpressionPtr &operand,
                         const KeepSlice &slice) {
  if (slice.step && *slice.step != 1) {
    throw std::out_of_range("keep slices do not support a step");
  }
  if (!slice.start && !slice.stop) {
    return operand;
  }
  if (!slice.start) {
    int stop = *slice.stop;
    if (stop >= 0) {
      return make_keep_node(operand, Order::Ascending, ones(stop), -1);
    }
    return make_keep_node(operand, Order::Descending, {}, -stop);
  }
  int start = *slice.start;
  if (!slice.stop) {
    if (start < 0) {
      return make_keep_node(operand, Order::Descending, ones(-start), -1);
    }
    return make_keep_node(operand, Order::Ascending, {}, start);
  }
  int stop = *slice.stop;
  if (start >= 0 && stop >= 0) {
    return make_keep_node(operand, Order::Ascending,
                          zeros_then_ones(start, stop - start), -1);
  }
  if (start < 0 && stop < 0) {
    return make_keep_node(operand, Order::Descending,
                          zeros_then_ones(-stop, stop - start), -1);
  }
  throw std::invalid_argument(
      "keep slice bounds must be both negative or both non-negative");
}

ExpressionPtr keep_sequence(const ExpressionPtr &operand,
                            const KeepSequence &sequence) {
  if (sequence.empty()) {
    throw std::invalid_argument("keep: empty index sequence");
  }
  auto ellipses = std::count(sequence.begin(), sequence.end(), kEllipsis);
  if (ellipses > 1) {
    throw std::out_of_range("keep index may contain at most one ellipsis");
  }
  std::vector<int> values;
  for (const auto &item : sequence) {
    if (item) {
      values.push_back(*item);
    }
  }
  std::shared_ptr<MultisetExpression> node;
  if (ellipses == 0) {
    node = make_node(ExpressionOp::Keep, {operand}, "keep");
    node->keep_order = Order::Ascending;
    node->keep_tuple = values;
    node->required_size = static_cast<int>(values.size());
    node->exact_size = true;
  } else if (!sequence.front()) {
    std::reverse(values.begin(), values.end());
    node = make_node(ExpressionOp::Keep, {operand}, "keep");
    node->keep_order = Order::Descending;
    node->keep_tuple = std::move(values);
  } else if (!sequence.back()) {
    node = make_node(ExpressionOp::Keep, {operand}, "keep");
    node->keep_order = Order::Ascending;
    node->keep_tuple = std::move(values);
  } else {
    // A centered ellipsis depends on the total size, known only for pools.
    node = make_node(ExpressionOp::Keep, {operand}, "keep");
    node->requires_pool = true;
  }
  node->keep_index = sequence;
  return node;
}

ExpressionPtr filter_node(const ExpressionPtr &operand,
                          std::vector<Outcome> targets,
                          std::function<bool(Outcome)> predicate,
                          bool invert) {
  auto node = make_node(ExpressionOp::FilterOutcomes, {operand},
                        "filter_outcomes");
  std::sort(targets.begin(), targets.end());
  targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
  node->target_outcomes = std::move(targets);
  node->predicate = std::move(predicate);
  node->invert = invert;
  return node;
}

ExpressionPtr
substitute(const ExpressionPtr &expression,
           const std::vector<ExpressionPtr> &bindings,
           std::unordered_map<const MultisetExpression *, ExpressionPtr> &memo) {
  auto found = memo.find(expression.get());
  if (found != memo.end()) {
    return found->second;
  }
  ExpressionPtr result;
  if (expression->op == ExpressionOp::Variable) {
    int index = expression->variable_index;
    if (index < 0 || index >= static_cast<int>(bindings.size())) {
      throw MultisetBindingError("multiset variable " + std::to_string(index) +
                                 " has no binding among " +
                                 std::to_string(bindings.size()) + " inputs");
    }
    result = bindings[static_cast<std::size_t>(index)];
  } else if (expression->children.empty()) {
    result = expression;
  } else {
    auto copy = std::make_shared<MultisetExpression>(*expression);
    bool changed = false;
    for (auto &child : copy->children) {
      ExpressionPtr bound = substitute(child, bindings, memo);
      changed = changed || bound != child;
      child = std::move(bound);
    }
    result = changed ? ExpressionPtr(copy) : expression;
  }
  memo.emplace(expression.get(), result);
  return result;
}

} // namespace

bool compare_counts(Comparison comparison, std::int64_t left,
                    std::int64_t right) {
  switch (comparison) {
  case Comparison::Equal:
    return left == right;
  case Comparison::NotEqual:
    return left != right;
  case Comparison::LessEqual:
    return left <= right;
  case Comparison::Less:
    return left < right;
  case Comparison::GreaterEqual:
    return left >= right;
  case Comparison::Greater:
    return left > right;
  }
  return false;
}

const char *comparison_name(Comparison comparison) {
  switch (comparison) {
  case Comparison::Equal:
    return "==";
  case Comparison::NotEqual:
    return "!=";
  case Comparison::LessEqual:
    return "<=";
  case Comparison::Less:
    return "<";
  case Comparison::GreaterEqual:
    return ">=";
  case Comparison::Greater:
    return ">";
  }
  return "?";
}

ExpressionPtr source_expression(SourcePtr source) {
  if (!source) {
    throw std::invalid_argument("source_expression: null source");
  }
  auto node = std::make_shared<MultisetExpression>();
  node->op = ExpressionOp::Source;
  node->source = std::move(source);
  node->slot = -1;
  return node;
}

ExpressionPtr hand_expression(const DealPtr &deal, int hand) {
  if (!deal) {
    throw std::invalid_argument("hand_expression: null deal");
  }
  if (hand < 0 || hand >= deal->output_arity()) {
    throw std::out_of_range("hand_expression: hand " + std::to_string(hand) +
                            " out of range");
  }
  auto node = std::make_shared<MultisetExpression>();
  node->op = ExpressionOp::Source;
  node->source = deal;
  node->slot = hand;
  return node;
}

ExpressionPtr multiset_variable(int index) {
  if (index < 0) {
    throw std::invalid_argument("multiset_variable: negative index");
  }
  auto node = std::make_shared<MultisetExpression>();
  node->op = ExpressionOp::Variable;
  node->variable_index = index;
  return node;
}

int expression_arity(const ExpressionPtr &expression) {
  if (expression->op == ExpressionOp::Source && expression->slot < 0) {
    return expression->source->output_arity();
  }
  return 1;
}

ExpressionPtr multiset_union(const std::vector<ExpressionPtr> &operands) {
  return make_node(ExpressionOp::Union, operands, "union");
}

ExpressionPtr
multiset_intersection(const std::vector<ExpressionPtr> &operands) {
  return make_node(ExpressionOp::Intersection, operands, "intersection");
}

ExpressionPtr multiset_difference(const std::vector<ExpressionPtr> &operands,
                                  bool keep_negative_counts) {
  if (operands.empty()) {
    throw std::invalid_argument("difference: requires at least one operand");
  }
  auto node = make_node(ExpressionOp::Difference, operands, "difference");
  node->keep_negative_counts = keep_negative_counts;
  return node;
}

ExpressionPtr multiset_symmetric_difference(const ExpressionPtr &left,
                                            const ExpressionPtr &right) {
  return make_node(ExpressionOp::SymmetricDifference, {left, right},
                   "symmetric_difference");
}

ExpressionPtr
multiset_additive_union(const std::vector<ExpressionPtr> &operands) {
  return make_node(ExpressionOp::AdditiveUnion, operands, "additive_union");
}

ExpressionPtr multiply_counts(const ExpressionPtr &operand, int factor) {
  auto node =
      make_node(ExpressionOp::MultiplyCounts, {operand}, "multiply_counts");
  node->constant = factor;
  return node;
}

ExpressionPtr divide_counts(const ExpressionPtr &operand, int divisor) {
  if (divisor == 0) {
    throw std::invalid_argument("divide_counts: division by zero");
  }
  auto node =
      make_node(ExpressionOp::FloorDivideCounts, {operand}, "divide_counts");
  node->constant = divisor;
  return node;
}

ExpressionPtr modulo_counts(const ExpressionPtr &operand, int divisor) {
  if (divisor == 0) {
    throw std::invalid_argument("modulo_counts: division by zero");
  }
  auto node = make_node(ExpressionOp::ModuloCounts, {operand}, "modulo_counts");
  node->constant = divisor;
  return node;
}

ExpressionPtr keep_counts(const ExpressionPtr &operand, Comparison comparison,
                          int threshold) {
  auto node = make_node(ExpressionOp::KeepCounts, {operand}, "keep_counts");
  node->comparison = comparison;
  node->constant = threshold;
  return node;
}

ExpressionPtr unique_counts(const ExpressionPtr &operand, int limit) {
  auto node = make_node(ExpressionOp::UniqueCounts, {operand}, "unique");
  node->constant = limit;
  return node;
}

ExpressionPtr keep_outcomes(const ExpressionPtr &operand,
                            std::vector<Outcome> targets) {
  return filter_node(operand, std::move(targets), nullptr, false);
}

ExpressionPtr drop_outcomes(const ExpressionPtr &operand,
                            std::vector<Outcome> targets) {
  return filter_node(operand, std::move(targets), nullptr, true);
}

ExpressionPtr keep_outcomes_if(const ExpressionPtr &operand,
                               std::function<bool(Outcome)> predicate) {
  if (!predicate) {
    throw std::invalid_argument("keep_outcomes_if: empty predicate");
  }
  return filter_node(operand, {}, std::move(predicate), false);
}

ExpressionPtr drop_outcomes_if(const ExpressionPtr &operand,
                               std::function<bool(Outcome)> predicate) {
  if (!predicate) {
    throw std::invalid_argument("drop_outcomes_if: empty predicate");
  }
  return filter_node(operand, {}, std::move(predicate), true);
}

ExpressionPtr keep_outcomes_in(const ExpressionPtr &operand,
                               const ExpressionPtr &targets) {
  return make_node(ExpressionOp::FilterOutcomesByExpression,
                   {operand, targets}, "keep_outcomes");
}

ExpressionPtr drop_outcomes_in(const ExpressionPtr &operand,
                               const ExpressionPtr &targets) {
  auto node = make_node(ExpressionOp::FilterOutcomesByExpression,
                        {operand, targets}, "drop_outcomes");
  node->invert = true;
  return node;
}

ExpressionPtr keep(const ExpressionPtr &operand, const KeepIndex &index) {
  require_unary(operand, "keep");
  if (const int *position = std::get_if<int>(&index)) {
    auto node = make_node(ExpressionOp::Keep, {operand}, "keep");
    if (*position >= 0) {
      node->keep_order = Order::Ascending;
      node->keep_tuple = zeros_then_ones(*position, 1);
      node->required_size = *position + 1;
    } else {
      node->keep_order = Order::Descending;
      node->keep_tuple = zeros_then_ones(-*position - 1, 1);
      node->required_size = -*position;
    }
    return node;
  }
  if (const auto *slice = std::get_if<KeepSlice>(&index)) {
    return keep_slice(operand, *slice);
  }
  return keep_sequence(operand, std::get<KeepSequence>(index));
}

ExpressionPtr highest(const ExpressionPtr &operand, int keep, int drop) {
  if (keep < 0 || drop < 0) {
    throw std::out_of_range("highest: keep and drop must be non-negative");
  }
  return make_keep_node(operand, Order::Descending,
                        zeros_then_ones(drop, keep), -1);
}

ExpressionPtr lowest(const ExpressionPtr &operand, int keep, int drop) {
  if (keep < 0 || drop < 0) {
    throw std::out_of_range("lowest: keep and drop must be non-negative");
  }
  return make_keep_node(operand, Order::Ascending, zeros_then_ones(drop, keep),
                        -1);
}

ExpressionPtr sort_pair(const ExpressionPtr &left, Comparison comparison,
                        const ExpressionPtr &right, Order order,
                        PairExtra extra) {
  auto node = make_node(ExpressionOp::SortPair, {left, right}, "sort_pair");
  node->comparison = comparison;
  node->pair_order = order == Order::Any ? Order::Descending : order;
  node->extra = extra;
  return node;
}

ExpressionPtr max_pair(const ExpressionPtr &left, Comparison comparison,
                       const ExpressionPtr &right, bool keep_paired) {
  switch (comparison) {
  case Comparison::Equal:
    if (keep_paired) {
      return multiset_intersection({left, right});
    }
    return multiset_difference({left, right});
  case Comparison::NotEqual:
    throw std::invalid_argument("max_pair: '!=' is not supported");
  default:
    break;
  }
  auto node = make_node(ExpressionOp::MaxPair, {left, right}, "max_pair");
  node->comparison = comparison;
  // Left elements pair with right elements seen earlier in this order.
  node->pair_order = (comparison == Comparison::LessEqual ||
                      comparison == Comparison::Less)
                         ? Order::Descending
                         : Order::Ascending;
  node->pair_equal = comparison == Comparison::LessEqual ||
                     comparison == Comparison::GreaterEqual;
  node->pair_keep = keep_paired;
  return node;
}

ExpressionPtr substitute_variables(const ExpressionPtr &expression,
                                   const std::vector<ExpressionPtr> &bindings) {
  std::unordered_map<const MultisetExpression *, ExpressionPtr> memo;
  return substitute(expression, bindings, memo);
}

} // namespace rollr
