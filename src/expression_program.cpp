#include "expression_program.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "errors.h"

namespace rollr {
namespace {

struct CompileState {
  ExpressionProgram *program{nullptr};
  std::unordered_map<const MultisetSource *, int> source_index;
  std::unordered_map<const MultisetSource *, int> source_leaf_refs;
  std::unordered_map<const MultisetExpression *, int> parent_refs;
  std::unordered_map<const MultisetExpression *, int> compiled;
  std::vector<std::string> op_keys;
  std::vector<OrderPreference> preferences;
};

void count_refs(const MultisetExpression *node, CompileState &state,
                std::unordered_set<const MultisetExpression *> &seen) {
  if (!seen.insert(node).second) {
    return;
  }
  if (node->op == ExpressionOp::Source) {
    ++state.source_leaf_refs[node->source.get()];
  }
  for (const auto &child : node->children) {
    ++state.parent_refs[child.get()];
    count_refs(child.get(), state, seen);
  }
}

int register_source(const SourcePtr &source, CompileState &state) {
  auto it = state.source_index.find(source.get());
  if (it != state.source_index.end()) {
    return it->second;
  }
  ExpressionProgram &program = *state.program;
  int index = static_cast<int>(program.sources.size());
  program.sources.push_back(source);
  program.source_slot_begin.push_back(program.source_slot_count);
  program.source_slot_count += source->output_arity();
  state.source_index.emplace(source.get(), index);
  return index;
}

int push_op(ExpressionOpEntry entry, std::string key, CompileState &state) {
  ExpressionProgram &program = *state.program;
  entry.state_offset = program.state_width;
  program.state_width += entry.state_width;
  program.ops.push_back(entry);
  state.op_keys.push_back(std::move(key));
  return static_cast<int>(program.ops.size()) - 1;
}

int emit_source_op(const MultisetExpression *node, const SourcePtr &source,
                   int slot, CompileState &state) {
  ExpressionOpEntry entry;
  entry.op = ExpressionOp::Source;
  entry.node = node;
  entry.source_index = register_source(source, state);
  entry.source_slot = slot;
  std::vector<int> sizes = source->slot_sizes();
  entry.size = sizes.at(static_cast<std::size_t>(slot));
  std::ostringstream key;
  key << 's' << entry.source_index << '.' << slot;
  return push_op(entry, key.str(), state);
}

std::vector<int> pool_apply_tuple(const MultisetExpression &node, int size) {
  if (node.required_size > size) {
    throw std::out_of_range("keep: index " +
                            std::to_string(node.required_size - 1) +
                            " out of range for " + std::to_string(size) +
                            " elements");
  }
  std::vector<int> out(static_cast<std::size_t>(std::max(size, 0)), 0);
  if (node.drop >= 0) {
    int dropped = std::min(node.drop, size);
    if (node.keep_order == Order::Ascending) {
      std::fill(out.begin() + dropped, out.end(), 1);
    } else {
      std::fill(out.begin(), out.end() - dropped, 1);
    }
    return out;
  }
  std::size_t n = std::min(out.size(), node.keep_tuple.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (node.keep_order == Order::Ascending) {
      out[i] = node.keep_tuple[i];
    } else {
      out[out.size() - 1 - i] = node.keep_tuple[i];
    }
  }
  return out;
}

// Folds a keep applied directly to an otherwise unused pool into the pool's
// keep tuple, which lets the pool skip dropped dice in bulk.
SourcePtr try_fold_pool_keep(const MultisetExpression *node,
                             CompileState &state) {
  const MultisetExpression *child = node->children.front().get();
  if (child->op != ExpressionOp::Source ||
      child->source->kind() != SourceKind::Pool ||
      state.source_leaf_refs[child->source.get()] != 1 ||
      state.parent_refs[child] != 1) {
    return nullptr;
  }
  const auto &pool = static_cast<const PoolSource &>(*child->source);
  if (node->keep_index) {
    return pool.keep(*node->keep_index);
  }
  std::vector<int> apply = pool_apply_tuple(*node, pool.keep_size());
  KeepSequence sequence(apply.begin(), apply.end());
  return pool.keep(sequence);
}

std::string op_label(const MultisetExpression &node) {
  std::ostringstream out;
  switch (node.op) {
  case ExpressionOp::Union:
    out << "union";
    break;
  case ExpressionOp::Intersection:
    out << "intersection";
    break;
  case ExpressionOp::Difference:
    out << (node.keep_negative_counts ? "difference_signed" : "difference");
    break;
  case ExpressionOp::SymmetricDifference:
    out << "symmetric_difference";
    break;
  case ExpressionOp::AdditiveUnion:
    out << "additive_union";
    break;
  case ExpressionOp::MultiplyCounts:
    out << "mul" << node.constant;
    break;
  case ExpressionOp::FloorDivideCounts:
    out << "div" << node.constant;
    break;
  case ExpressionOp::ModuloCounts:
    out << "mod" << node.constant;
    break;
  case ExpressionOp::KeepCounts:
    out << "keep_counts" << comparison_name(node.comparison) << node.constant;
    break;
  case ExpressionOp::UniqueCounts:
    out << "unique" << node.constant;
    break;
  case ExpressionOp::FilterOutcomes:
    out << (node.invert ? "drop_outcomes" : "keep_outcomes");
    if (node.predicate) {
      out << "@fn" << static_cast<const void *>(&node);
    } else {
      out << outcomes_key(node.target_outcomes);
    }
    break;
  case ExpressionOp::FilterOutcomesByExpression:
    out << (node.invert ? "drop_outcomes_in" : "keep_outcomes_in");
    break;
  case ExpressionOp::Keep:
    out << "keep_" << order_name(node.keep_order);
    if (node.drop >= 0) {
      out << "_drop" << node.drop;
    } else {
      out << keep_tuple_key(node.keep_tuple);
    }
    break;
  case ExpressionOp::SortPair:
    out << "sort_pair" << comparison_name(node.comparison)
        << order_name(node.pair_order) << static_cast<int>(node.extra);
    break;
  case ExpressionOp::MaxPair:
    out << "max_pair" << order_name(node.pair_order)
        << (node.pair_equal ? "_eq" : "") << (node.pair_keep ? "_keep" : "_drop");
    break;
  default:
    out << "op" << static_cast<int>(node.op);
    break;
  }
  return out.str();
}

int op_size(const MultisetExpression &node, const std::vector<int> &child_sizes) {
  bool known = std::all_of(child_sizes.begin(), child_sizes.end(),
                           [](int s) { return s >= 0; });
  switch (node.op) {
  case ExpressionOp::AdditiveUnion: {
    if (!known) {
      return -1;
    }
    int total = 0;
    for (int s : child_sizes) {
      total += s;
    }
    return total;
  }
  case ExpressionOp::MultiplyCounts:
    return known && node.constant >= 0 ? child_sizes[0] * node.constant : -1;
  case ExpressionOp::Keep: {
    if (!known) {
      return -1;
    }
    int size = child_sizes[0];
    if (node.drop >= 0) {
      return std::max(size - node.drop, 0);
    }
    int total = 0;
    for (int i = 0; i < size && i < static_cast<int>(node.keep_tuple.size());
         ++i) {
      total += node.keep_tuple[static_cast<std::size_t>(i)];
    }
    return total;
  }
  default:
    return -1;
  }
}

int compile_node(const ExpressionPtr &expression, CompileState &state) {
  const MultisetExpression *node = expression.get();
  auto found = state.compiled.find(node);
  if (found != state.compiled.end()) {
    return found->second;
  }
  int index = -1;
  switch (node->op) {
  case ExpressionOp::Variable:
    throw MultisetBindingError("multiset variable " +
                               std::to_string(node->variable_index) +
                               " is not bound to an input");
  case ExpressionOp::Source:
    index = emit_source_op(node, node->source, std::max(node->slot, 0), state);
    break;
  default: {
    if (node->op == ExpressionOp::Keep) {
      SourcePtr folded = try_fold_pool_keep(node, state);
      if (folded) {
        index = emit_source_op(node, folded, 0, state);
        break;
      }
      if (node->requires_pool) {
        throw std::invalid_argument(
            "keep: a centered ellipsis needs an otherwise unused pool operand");
      }
    }
    std::vector<int> child_ops;
    std::vector<int> child_sizes;
    child_ops.reserve(node->children.size());
    for (const auto &child : node->children) {
      int child_op = compile_node(child, state);
      child_ops.push_back(child_op);
      child_sizes.push_back(
          state.program->ops[static_cast<std::size_t>(child_op)].size);
    }
    ExpressionProgram &program = *state.program;
    ExpressionOpEntry entry;
    entry.op = node->op;
    entry.node = node;
    entry.child_begin = static_cast<int>(program.children.size());
    entry.child_count = static_cast<int>(child_ops.size());
    program.children.insert(program.children.end(), child_ops.begin(),
                            child_ops.end());
    entry.size = op_size(*node, child_sizes);
    switch (node->op) {
    case ExpressionOp::Keep:
      entry.state_width = 1;
      state.preferences.push_back({node->keep_order, OrderReason::Mandatory});
      break;
    case ExpressionOp::SortPair:
      entry.state_width = 2;
      state.preferences.push_back({node->pair_order, OrderReason::Default});
      break;
    case ExpressionOp::MaxPair:
      entry.state_width = 1;
      state.preferences.push_back({node->pair_order, OrderReason::Mandatory});
      break;
    case ExpressionOp::FilterOutcomes:
      if (node->predicate) {
        program.cacheable = false;
      }
      break;
    default:
      break;
    }
    std::ostringstream key;
    key << op_label(*node) << '(';
    for (std::size_t i = 0; i < child_ops.size(); ++i) {
      if (i > 0) {
        key << ',';
      }
      key << state.op_keys[static_cast<std::size_t>(child_ops[i])];
    }
    key << ')';
    index = push_op(entry, key.str(), state);
    break;
  }
  }
  state.compiled.emplace(node, index);
  return index;
}

int floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return static_cast<int>(q);
}

int floor_mod(std::int64_t a, std::int64_t b) {
  std::int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) {
    r += b;
  }
  return static_cast<int>(r);
}

struct LexiTuple {
  int tie{0};
  int left_extra{0};
  int left_first{0};
  int right_first{0};
  int right_extra{0};
};

LexiTuple compute_lexi_tuple(Comparison comparison, Order order,
                             PairExtra extra) {
  LexiTuple out;
  switch (comparison) {
  case Comparison::Equal:
    out.tie = 1;
    break;
  case Comparison::NotEqual:
    out.left_first = 1;
    out.right_first = 1;
    break;
  case Comparison::LessEqual:
    out.tie = 1;
    out.left_first = 1;
    break;
  case Comparison::Less:
    out.left_first = 1;
    break;
  case Comparison::GreaterEqual:
    out.tie = 1;
    out.right_first = 1;
    break;
  case Comparison::Greater:
    out.right_first = 1;
    break;
  }
  if (order == Order::Descending) {
    std::swap(out.left_first, out.right_first);
  }
  if (extra == PairExtra::Low) {
    extra = order == Order::Ascending ? PairExtra::Early : PairExtra::Late;
  } else if (extra == PairExtra::High) {
    extra = order == Order::Descending ? PairExtra::Early : PairExtra::Late;
  }
  switch (extra) {
  case PairExtra::Early:
    out.left_extra = out.left_first;
    out.right_extra = out.right_first;
    break;
  case PairExtra::Late:
    out.left_extra = out.right_first;
    out.right_extra = out.left_first;
    break;
  case PairExtra::Equal:
    out.left_extra = out.tie;
    out.right_extra = out.tie;
    break;
  case PairExtra::Keep:
    out.left_extra = 1;
    out.right_extra = 1;
    break;
  default:
    break;
  }
  return out;
}

void initialize_sort_pair(const ExpressionProgram &program,
                          const ExpressionOpEntry &entry, Order order,
                          ExpressionOpRuntime &runtime, EvalState &state) {
  const MultisetExpression &node = *entry.node;
  const int left_size =
      program.ops[static_cast<std::size_t>(
                      program.children[static_cast<std::size_t>(
                          entry.child_begin)])]
          .size;
  const int right_size =
      program.ops[static_cast<std::size_t>(
                      program.children[static_cast<std::size_t>(
                          entry.child_begin + 1)])]
          .size;
  LexiTuple lexi = compute_lexi_tuple(node.comparison, node.pair_order,
                                      node.extra);
  std::int64_t &left_lead = state[static_cast<std::size_t>(entry.state_offset)];
  std::int64_t &countdown =
      state[static_cast<std::size_t>(entry.state_offset + 1)];
  if (order == node.pair_order) {
    runtime.forward = true;
    runtime.lexi = {{lexi.left_first, lexi.left_extra, lexi.tie,
                     lexi.right_first}};
    left_lead = 0;
    if (lexi.left_first == lexi.left_extra) {
      countdown = -1;
    } else {
      if (right_size < 0) {
        throw std::invalid_argument(
            "sort_pair: the size of the right operand must be known for this "
            "choice of extra");
      }
      countdown = right_size;
    }
    return;
  }
  runtime.forward = false;
  runtime.lexi = {{lexi.right_first, lexi.right_extra, lexi.tie,
                   lexi.left_first}};
  if (left_size < 0 || right_size < 0) {
    throw UnsupportedOrder(
        "sort_pair: reverse order needs the sizes of both operands");
  }
  if (lexi.left_first == lexi.left_extra) {
    left_lead = right_size - left_size;
    countdown = -1;
  } else {
    left_lead = 0;
    countdown = std::max(left_size - right_size, 0);
  }
}

std::int64_t step_sort_pair(const ExpressionOpRuntime &runtime,
                            std::int64_t *state, std::int64_t left_count,
                            std::int64_t right_count) {
  const int left_first = runtime.lexi[0];
  const int left_extra = runtime.lexi[1];
  const int tie = runtime.lexi[2];
  const int right_first = runtime.lexi[3];
  std::int64_t &left_lead = state[0];
  std::int64_t &countdown = state[1];
  std::int64_t extra_count = 0;
  if (countdown < 0) {
    left_count = std::max<std::int64_t>(left_count, 0);
  } else if (runtime.forward) {
    extra_count = std::max<std::int64_t>(left_count - countdown, 0);
    left_count = std::min(left_count, countdown);
    countdown -= left_count;
  } else {
    extra_count = std::min(left_count, countdown);
    left_count = std::max<std::int64_t>(left_count - countdown, 0);
    countdown -= extra_count;
  }
  right_count = std::max<std::int64_t>(right_count, 0);

  std::int64_t right_first_count =
      std::max<std::int64_t>(std::min(-left_lead, left_count), 0);
  std::int64_t tie_count = 0;
  if (left_lead >= 0) {
    tie_count = std::max<std::int64_t>(
        std::min(right_count - left_lead, left_count), 0);
  } else {
    tie_count = std::max<std::int64_t>(
        std::min(left_count + left_lead, right_count), 0);
  }
  left_lead += left_count - right_count;
  std::int64_t left_first_count =
      std::max<std::int64_t>(std::min(left_lead, left_count), 0);
  return right_first_count * right_first + tie_count * tie +
         left_first_count * left_first + extra_count * left_extra;
}

} // namespace

ExpressionProgram
compile_expression_program(const std::vector<ExpressionPtr> &inputs) {
  ExpressionProgram program;
  CompileState state;
  state.program = &program;
  std::unordered_set<const MultisetExpression *> seen;
  for (const auto &input : inputs) {
    if (!input) {
      throw std::invalid_argument("evaluate: null input expression");
    }
    ++state.parent_refs[input.get()];
    count_refs(input.get(), state, seen);
  }
  for (const auto &input : inputs) {
    if (input->op == ExpressionOp::Source && input->slot < 0 &&
        input->source->output_arity() != 1) {
      for (int slot = 0; slot < input->source->output_arity(); ++slot) {
        program.outputs.push_back(
            emit_source_op(input.get(), input->source, slot, state));
      }
      continue;
    }
    program.outputs.push_back(compile_node(input, state));
  }
  program.order_preference = merge_order_preferences(state.preferences);

  std::ostringstream key;
  for (std::size_t i = 0; i < program.outputs.size(); ++i) {
    if (i > 0) {
      key << '|';
    }
    key << state.op_keys[static_cast<std::size_t>(program.outputs[i])];
  }
  program.key = key.str();
  return program;
}

ExpressionRuntime initialize_expression_runtime(const ExpressionProgram &program,
                                                Order order) {
  ExpressionRuntime runtime;
  runtime.order = order;
  runtime.ops.resize(program.ops.size());
  runtime.initial_state.assign(static_cast<std::size_t>(program.state_width),
                               0);
  for (std::size_t i = 0; i < program.ops.size(); ++i) {
    const ExpressionOpEntry &entry = program.ops[i];
    const MultisetExpression &node = *entry.node;
    switch (entry.op) {
    case ExpressionOp::Keep: {
      if (order != node.keep_order) {
        throw UnsupportedOrder(std::string("keep: requires ") +
                               order_name(node.keep_order) + " order");
      }
      const int child_size =
          program.ops[static_cast<std::size_t>(
                          program.children[static_cast<std::size_t>(
                              entry.child_begin)])]
              .size;
      if (child_size >= 0 && node.required_size > child_size) {
        throw std::out_of_range("keep: index " +
                                std::to_string(node.required_size - 1) +
                                " out of range for " +
                                std::to_string(child_size) + " elements");
      }
      if (child_size >= 0 && node.exact_size &&
          node.required_size != child_size) {
        throw std::out_of_range("keep: sequence of length " +
                                std::to_string(node.required_size) +
                                " does not match " +
                                std::to_string(child_size) + " elements");
      }
      runtime.initial_state[static_cast<std::size_t>(entry.state_offset)] =
          node.drop >= 0 ? node.drop : 0;
      break;
    }
    case ExpressionOp::MaxPair:
      if (order != node.pair_order) {
        throw UnsupportedOrder(std::string("max_pair: requires ") +
                               order_name(node.pair_order) + " order");
      }
      break;
    case ExpressionOp::SortPair:
      initialize_sort_pair(program, entry, order, runtime.ops[i],
                           runtime.initial_state);
      break;
    default:
      break;
    }
  }
  runtime.output_sizes.reserve(program.outputs.size());
  for (int output : program.outputs) {
    runtime.output_sizes.push_back(
        program.ops[static_cast<std::size_t>(output)].size);
  }
  return runtime;
}

void step_expression(const ExpressionProgram &program,
                     const ExpressionRuntime &runtime, EvalState &state,
                     Outcome outcome, const std::vector<int> &source_counts,
                     std::vector<std::int64_t> &values,
                     std::vector<int> &outputs) {
  values.assign(program.ops.size(), 0);
  for (std::size_t i = 0; i < program.ops.size(); ++i) {
    const ExpressionOpEntry &entry = program.ops[i];
    const MultisetExpression &node = *entry.node;
    auto child = [&](int k) {
      return values[static_cast<std::size_t>(
          program.children[static_cast<std::size_t>(entry.child_begin + k)])];
    };
    std::int64_t value = 0;
    switch (entry.op) {
    case ExpressionOp::Source:
      value = source_counts[static_cast<std::size_t>(
          program.source_slot_begin[static_cast<std::size_t>(
              entry.source_index)] +
          entry.source_slot)];
      break;
    case ExpressionOp::Union:
      value = child(0);
      for (int k = 1; k < entry.child_count; ++k) {
        value = std::max(value, child(k));
      }
      break;
    case ExpressionOp::Intersection:
      value = child(0);
      for (int k = 1; k < entry.child_count; ++k) {
        value = std::min(value, child(k));
      }
      break;
    case ExpressionOp::Difference:
      value = child(0);
      for (int k = 1; k < entry.child_count; ++k) {
        value -= child(k);
      }
      if (!node.keep_negative_counts) {
        value = std::max<std::int64_t>(value, 0);
      }
      break;
    case ExpressionOp::SymmetricDifference:
      value = std::max<std::int64_t>(child(0), 0) -
              std::max<std::int64_t>(child(1), 0);
      value = value < 0 ? -value : value;
      break;
    case ExpressionOp::AdditiveUnion:
      for (int k = 0; k < entry.child_count; ++k) {
        value += child(k);
      }
      break;
    case ExpressionOp::MultiplyCounts:
      value = child(0) * node.constant;
      break;
    case ExpressionOp::FloorDivideCounts:
      value = floor_div(child(0), node.constant);
      break;
    case ExpressionOp::ModuloCounts:
      value = floor_mod(child(0), node.constant);
      break;
    case ExpressionOp::KeepCounts:
      value = compare_counts(node.comparison, child(0), node.constant)
                  ? child(0)
                  : 0;
      break;
    case ExpressionOp::UniqueCounts:
      value = std::min<std::int64_t>(child(0), node.constant);
      break;
    case ExpressionOp::FilterOutcomes: {
      bool match = node.predicate
                       ? node.predicate(outcome)
                       : std::binary_search(node.target_outcomes.begin(),
                                            node.target_outcomes.end(),
                                            outcome);
      value = match != node.invert ? child(0) : 0;
      break;
    }
    case ExpressionOp::FilterOutcomesByExpression:
      value = (child(1) > 0) != node.invert ? child(0) : 0;
      break;
    case ExpressionOp::Keep: {
      // Negative counts hold no elements to rank.
      std::int64_t count = std::max<std::int64_t>(child(0), 0);
      std::int64_t &slot = state[static_cast<std::size_t>(entry.state_offset)];
      if (node.drop >= 0) {
        std::int64_t dropped = std::min(slot, count);
        slot -= dropped;
        value = count - dropped;
      } else {
        const std::int64_t size =
            static_cast<std::int64_t>(node.keep_tuple.size());
        std::int64_t end = std::min(slot + count, size);
        for (std::int64_t k = slot; k < end; ++k) {
          value += node.keep_tuple[static_cast<std::size_t>(k)];
        }
        slot = end;
      }
      break;
    }
    case ExpressionOp::SortPair:
      value = step_sort_pair(
          runtime.ops[i], &state[static_cast<std::size_t>(entry.state_offset)],
          child(0), child(1));
      break;
    case ExpressionOp::MaxPair: {
      std::int64_t left = std::max<std::int64_t>(child(0), 0);
      std::int64_t right = std::max<std::int64_t>(child(1), 0);
      std::int64_t &pairable =
          state[static_cast<std::size_t>(entry.state_offset)];
      std::int64_t pairs = node.pair_equal ? std::min(pairable + right, left)
                                           : std::min(pairable, left);
      pairable += right - pairs;
      value = node.pair_keep ? pairs : left - pairs;
      break;
    }
    default:
      break;
    }
    values[i] = value;
  }
  outputs.resize(program.outputs.size());
  for (std::size_t i = 0; i < program.outputs.size(); ++i) {
    outputs[i] = static_cast<int>(
        values[static_cast<std::size_t>(program.outputs[i])]);
  }
}

} // namespace rollr
