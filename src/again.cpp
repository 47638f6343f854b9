#include "again.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

namespace rollr {
namespace {

constexpr Outcome kNegativeInfinity = std::numeric_limits<Outcome>::min();

bool is_infinite(Outcome x) {
  return x == kAgainInfinity || x == kNegativeInfinity;
}

Outcome saturating_add(Outcome a, Outcome b) {
  if (a == kAgainInfinity || b == kAgainInfinity) {
    if (a == kNegativeInfinity || b == kNegativeInfinity) {
      throw std::domain_error("again: infinite outcomes of opposite sign");
    }
    return kAgainInfinity;
  }
  if (a == kNegativeInfinity || b == kNegativeInfinity) {
    return kNegativeInfinity;
  }
  if ((b > 0 && a > kAgainInfinity - b) || (b < 0 && a < kNegativeInfinity - b)) {
    throw std::overflow_error("again: outcome overflow");
  }
  return a + b;
}

Outcome saturating_negate(Outcome a) {
  if (a == kAgainInfinity) {
    return kNegativeInfinity;
  }
  if (a == kNegativeInfinity) {
    return kAgainInfinity;
  }
  return -a;
}

Outcome saturating_multiply(Outcome a, Outcome b) {
  if (is_infinite(a) || is_infinite(b)) {
    if (a == 0 || b == 0) {
      throw std::domain_error("again: infinite outcome multiplied by zero");
    }
    return ((a > 0) == (b > 0)) ? kAgainInfinity : kNegativeInfinity;
  }
  Weight product = Weight(a) * b;
  if (product >= kAgainInfinity || product <= kNegativeInfinity) {
    throw std::overflow_error("again: outcome overflow");
  }
  return a * b;
}

AgainExprPtr make_again_node(AgainOp op, std::vector<AgainExprPtr> children) {
  for (const auto &child : children) {
    if (!child) {
      throw std::invalid_argument("again: null operand");
    }
  }
  auto node = std::make_shared<AgainExpr>();
  node->op = op;
  node->children = std::move(children);
  return node;
}

Die constant_die(Outcome value) {
  return Die::from_pairs({{value, Weight(1)}});
}

// Evaluates `expr` with each placeholder an independent roll of `tail`.
Die evaluate_again(const AgainExpr &expr, const Die &tail) {
  switch (expr.op) {
  case AgainOp::Placeholder:
    return tail;
  case AgainOp::Constant:
    return constant_die(expr.constant);
  case AgainOp::Negate:
    return die_map(evaluate_again(*expr.children[0], tail),
                   [](Outcome x) -> std::optional<Outcome> {
                     return saturating_negate(x);
                   });
  case AgainOp::Add:
    return die_apply(evaluate_again(*expr.children[0], tail),
                     evaluate_again(*expr.children[1], tail),
                     [](Outcome a, Outcome b) -> std::optional<Outcome> {
                       return saturating_add(a, b);
                     });
  case AgainOp::Subtract:
    return die_apply(evaluate_again(*expr.children[0], tail),
                     evaluate_again(*expr.children[1], tail),
                     [](Outcome a, Outcome b) -> std::optional<Outcome> {
                       return saturating_add(a, saturating_negate(b));
                     });
  case AgainOp::Multiply:
    return die_apply(evaluate_again(*expr.children[0], tail),
                     evaluate_again(*expr.children[1], tail),
                     [](Outcome a, Outcome b) -> std::optional<Outcome> {
                       return saturating_multiply(a, b);
                     });
  }
  throw std::invalid_argument("again: unknown operation");
}

bool has_again(const AgainEntry &entry) {
  return std::holds_alternative<AgainExprPtr>(entry);
}

void validate_entries(const std::vector<AgainEntry> &entries,
                      const std::vector<Weight> &weights) {
  if (!weights.empty() && weights.size() != entries.size()) {
    throw std::invalid_argument(
        "again: weights must match the number of entries");
  }
  for (const auto &entry : entries) {
    if (const auto *tuple = std::get_if<AgainTuple>(&entry)) {
      for (const auto &item : tuple->items) {
        if (std::holds_alternative<AgainExprPtr>(item)) {
          throw std::invalid_argument(
              "Again is not allowed inside tuple outcomes");
        }
      }
      throw std::invalid_argument("again: tuple outcomes are not supported");
    }
    if (const auto *expr = std::get_if<AgainExprPtr>(&entry)) {
      if (!*expr) {
        throw std::invalid_argument("again: null expression entry");
      }
    }
  }
}

// Resolves every entry against `tail`. A null tail drops the entries that
// roll again.
Die resolve_entries(const std::vector<AgainEntry> &entries,
                    const std::vector<Weight> &weights, const Die *tail) {
  std::vector<Die> parts;
  std::vector<Weight> part_weights;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const AgainEntry &entry = entries[i];
    Die part;
    if (const auto *outcome = std::get_if<Outcome>(&entry)) {
      part = constant_die(*outcome);
    } else if (const auto *die = std::get_if<Die>(&entry)) {
      part = *die;
    } else {
      if (!tail) {
        continue;
      }
      part = evaluate_again(*std::get<AgainExprPtr>(entry), *tail);
    }
    parts.push_back(std::move(part));
    part_weights.push_back(weights.empty() ? Weight(1) : weights[i]);
  }
  return die_mixture(parts, part_weights);
}

} // namespace

AgainExprPtr again() { return make_again_node(AgainOp::Placeholder, {}); }

AgainExprPtr again_constant(Outcome value) {
  auto node = std::make_shared<AgainExpr>();
  node->op = AgainOp::Constant;
  node->constant = value;
  return node;
}

AgainExprPtr again_add(AgainExprPtr left, AgainExprPtr right) {
  return make_again_node(AgainOp::Add, {std::move(left), std::move(right)});
}

AgainExprPtr again_subtract(AgainExprPtr left, AgainExprPtr right) {
  return make_again_node(AgainOp::Subtract,
                         {std::move(left), std::move(right)});
}

AgainExprPtr again_multiply(AgainExprPtr left, AgainExprPtr right) {
  return make_again_node(AgainOp::Multiply,
                         {std::move(left), std::move(right)});
}

AgainExprPtr again_negate(AgainExprPtr operand) {
  return make_again_node(AgainOp::Negate, {std::move(operand)});
}

AgainExprPtr again_plus(Outcome outcome) {
  return again_add(again_constant(outcome), again());
}

Die make_die_with_again(const std::vector<AgainEntry> &entries,
                        const std::vector<Weight> &weights, int depth,
                        AgainEnd end) {
  validate_entries(entries, weights);
  if (depth < 0) {
    throw std::invalid_argument("again: depth cannot be negative");
  }
  if (std::none_of(entries.begin(), entries.end(), has_again)) {
    return resolve_entries(entries, weights, nullptr);
  }

  Die tail;
  if (end.kind == AgainEnd::Kind::Reroll) {
    tail = resolve_entries(entries, weights, nullptr);
  } else {
    if (end.kind == AgainEnd::Kind::Default &&
        std::all_of(entries.begin(), entries.end(), has_again)) {
      throw std::invalid_argument(
          "again: every entry rolls again, an explicit end is required");
    }
    Outcome end_value = 0;
    if (end.kind == AgainEnd::Kind::Value) {
      end_value = end.value;
    } else if (end.kind == AgainEnd::Kind::Infinity) {
      end_value = kAgainInfinity;
    }
    Die value = constant_die(end_value);
    tail = resolve_entries(entries, weights, &value);
  }
  for (int level = 0; level < depth; ++level) {
    tail = resolve_entries(entries, weights, &tail);
  }
  return tail;
}

Die explode(const Die &die, std::vector<Outcome> targets, int depth,
            AgainEnd end) {
  if (depth < 0) {
    throw std::invalid_argument("explode: depth cannot be negative");
  }
  if (die.empty() || depth == 0) {
    return die;
  }
  if (targets.empty()) {
    targets.push_back(die.max_key());
  }
  std::sort(targets.begin(), targets.end());
  std::vector<AgainEntry> entries;
  std::vector<Weight> weights;
  entries.reserve(die.size());
  for (const auto &item : die.items()) {
    if (std::binary_search(targets.begin(), targets.end(), item.first)) {
      entries.emplace_back(again_plus(item.first));
    } else {
      entries.emplace_back(item.first);
    }
    weights.push_back(item.second);
  }
  return make_die_with_again(entries, weights, depth, end);
}

} // namespace rollr
