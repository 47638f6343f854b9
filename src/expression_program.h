#pragma once

#include <array>
#include <string>
#include <vector>

#include "multiset_expression.h"
#include "order.h"

namespace rollr {

struct ExpressionOpEntry {
  ExpressionOp op{ExpressionOp::Source};
  const MultisetExpression *node{nullptr};
  int child_begin{-1};
  int child_count{0};
  int source_index{-1};
  int source_slot{0};
  int state_offset{0};
  int state_width{0};
  // Elements produced by this op if known, else -1.
  int size{-1};
};

// Expression trees flattened to a topologically ordered op list. Each
// distinct source object is one random draw, however many leaves use it.
struct ExpressionProgram {
  std::vector<ExpressionOpEntry> ops;
  std::vector<int> children;
  std::vector<SourcePtr> sources;
  std::vector<int> source_slot_begin;
  int source_slot_count{0};
  // One op per count fed to the evaluator.
  std::vector<int> outputs;
  int state_width{0};
  OrderPreference order_preference;
  // Canonical encoding of the ops; sources are referenced by index.
  std::string key;
  bool cacheable{true};
};

ExpressionProgram
compile_expression_program(const std::vector<ExpressionPtr> &inputs);

// Per-order constants of one op.
struct ExpressionOpRuntime {
  // left_first, left_extra, tie, right_first as seen in traversal order.
  std::array<int, 4> lexi{{0, 0, 0, 0}};
  bool forward{true};
};

struct ExpressionRuntime {
  Order order{Order::Ascending};
  std::vector<ExpressionOpRuntime> ops;
  EvalState initial_state;
  std::vector<int> output_sizes;
};

// Throws UnsupportedOrder if some op cannot run in `order`.
ExpressionRuntime initialize_expression_runtime(const ExpressionProgram &program,
                                                Order order);

// Advances `state` past `outcome`. `source_counts` holds the popped counts
// laid out by source_slot_begin; `values` receives one count per op and
// `outputs` one count per program output.
void step_expression(const ExpressionProgram &program,
                     const ExpressionRuntime &runtime, EvalState &state,
                     Outcome outcome, const std::vector<int> &source_counts,
                     std::vector<std::int64_t> &values,
                     std::vector<int> &outputs);

} // namespace rollr
