#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "deal.h"
#include "keep_tuple.h"
#include "multiset_source.h"
#include "order.h"
#include "pool.h"

namespace rollr {

enum class ExpressionOp : std::uint8_t {
  Source = 0,
  Variable = 1,
  Union = 2,
  Intersection = 3,
  Difference = 4,
  SymmetricDifference = 5,
  AdditiveUnion = 6,
  MultiplyCounts = 7,
  FloorDivideCounts = 8,
  ModuloCounts = 9,
  KeepCounts = 10,
  UniqueCounts = 11,
  FilterOutcomes = 12,
  FilterOutcomesByExpression = 13,
  Keep = 14,
  SortPair = 15,
  MaxPair = 16
};

enum class Comparison : std::uint8_t {
  Equal = 0,
  NotEqual = 1,
  LessEqual = 2,
  Less = 3,
  GreaterEqual = 4,
  Greater = 5
};

// How unpaired elements of the left operand of sort_pair are scored.
enum class PairExtra : std::uint8_t {
  Early = 0,
  Late = 1,
  Low = 2,
  High = 3,
  Equal = 4,
  Keep = 5,
  Drop = 6
};

struct MultisetExpression;
using ExpressionPtr = std::shared_ptr<const MultisetExpression>;

// Node of a multiset expression tree. Nodes are immutable once built and
// may be shared between trees.
struct MultisetExpression {
  ExpressionOp op{ExpressionOp::Source};
  std::vector<ExpressionPtr> children;

  // Source leaves. slot < 0 feeds every slot of the source.
  SourcePtr source;
  int slot{-1};

  int variable_index{-1};

  bool keep_negative_counts{false};
  int constant{0};
  Comparison comparison{Comparison::Equal};

  std::vector<Outcome> target_outcomes;
  std::function<bool(Outcome)> predicate;
  bool invert{false};

  // Keep: entries counted from the keep_order end. drop >= 0 selects the
  // drop form instead of keep_tuple.
  Order keep_order{Order::Ascending};
  std::vector<int> keep_tuple;
  int drop{-1};
  int required_size{0};
  // Set for sequence indices; a pool operand applies it directly.
  std::optional<KeepIndex> keep_index;
  bool exact_size{false};
  bool requires_pool{false};

  Order pair_order{Order::Descending};
  PairExtra extra{PairExtra::Drop};
  bool pair_equal{false};
  bool pair_keep{true};
};

bool compare_counts(Comparison comparison, std::int64_t left,
                    std::int64_t right);
const char *comparison_name(Comparison comparison);

ExpressionPtr source_expression(SourcePtr source);
ExpressionPtr hand_expression(const DealPtr &deal, int hand);
ExpressionPtr multiset_variable(int index);

// Output arity of an expression: the number of counts it feeds.
int expression_arity(const ExpressionPtr &expression);

ExpressionPtr multiset_union(const std::vector<ExpressionPtr> &operands);
ExpressionPtr multiset_intersection(const std::vector<ExpressionPtr> &operands);
ExpressionPtr multiset_difference(const std::vector<ExpressionPtr> &operands,
                                  bool keep_negative_counts = false);
ExpressionPtr multiset_symmetric_difference(const ExpressionPtr &left,
                                            const ExpressionPtr &right);
ExpressionPtr
multiset_additive_union(const std::vector<ExpressionPtr> &operands);

ExpressionPtr multiply_counts(const ExpressionPtr &operand, int factor);
ExpressionPtr divide_counts(const ExpressionPtr &operand, int divisor);
ExpressionPtr modulo_counts(const ExpressionPtr &operand, int divisor);
ExpressionPtr keep_counts(const ExpressionPtr &operand, Comparison comparison,
                          int threshold);
ExpressionPtr unique_counts(const ExpressionPtr &operand, int limit = 1);

ExpressionPtr keep_outcomes(const ExpressionPtr &operand,
                            std::vector<Outcome> targets);
ExpressionPtr drop_outcomes(const ExpressionPtr &operand,
                            std::vector<Outcome> targets);
ExpressionPtr keep_outcomes_if(const ExpressionPtr &operand,
                               std::function<bool(Outcome)> predicate);
ExpressionPtr drop_outcomes_if(const ExpressionPtr &operand,
                               std::function<bool(Outcome)> predicate);
// Keeps (drops) outcomes whose count in `targets` is positive.
ExpressionPtr keep_outcomes_in(const ExpressionPtr &operand,
                               const ExpressionPtr &targets);
ExpressionPtr drop_outcomes_in(const ExpressionPtr &operand,
                               const ExpressionPtr &targets);

// Rank selection. Indices follow pool subscripting over the sorted elements.
// Negative incoming counts are treated as zero.
ExpressionPtr keep(const ExpressionPtr &operand, const KeepIndex &index);
ExpressionPtr highest(const ExpressionPtr &operand, int keep = 1,
                      int drop = 0);
ExpressionPtr lowest(const ExpressionPtr &operand, int keep = 1, int drop = 0);

// Sorts both operands in `order`, pairs them element by element and keeps
// the left elements whose pair satisfies `comparison`.
ExpressionPtr sort_pair(const ExpressionPtr &left, Comparison comparison,
                        const ExpressionPtr &right,
                        Order order = Order::Descending,
                        PairExtra extra = PairExtra::Drop);

// Forms as many pairs satisfying `comparison` as possible, then keeps (or
// drops) the paired left elements.
ExpressionPtr max_pair(const ExpressionPtr &left, Comparison comparison,
                       const ExpressionPtr &right, bool keep_paired = true);

// Replaces variable leaves with the given expressions.
ExpressionPtr substitute_variables(const ExpressionPtr &expression,
                                   const std::vector<ExpressionPtr> &bindings);

} // namespace rollr
