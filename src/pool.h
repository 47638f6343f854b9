#pragma once

#include <memory>
#include <string>
#include <vector>

#include "die.h"
#include "keep_tuple.h"
#include "multiset_source.h"

namespace rollr {

struct PoolDie {
  Die die;
  int count{0};
};

// Independent dice rolled together. The keep tuple gives the multiplier of
// each sorted rank (ascending) in the produced multiset.
class PoolSource : public MultisetSource {
public:
  // Dice are canonicalized: identical dice merge and order is by content.
  PoolSource(std::vector<PoolDie> dice, std::vector<Outcome> outcomes,
             std::vector<int> keep_tuple);

  SourceKind kind() const override { return SourceKind::Pool; }
  const std::vector<Outcome> &outcomes() const override { return outcomes_; }
  std::vector<int> slot_sizes() const override { return {keep_size()}; }
  Weight denominator() const override { return denominator_; }
  bool is_resolvable() const override;
  OrderPreference order_preference() const override;
  std::vector<SourcePop> pop(Order order, Outcome outcome) const override;

  const std::vector<PoolDie> &dice() const { return dice_; }
  const std::vector<int> &keep_tuple() const { return keep_tuple_; }
  int raw_size() const;
  int keep_size() const;
  bool has_negative_keeps() const;

  Weight pop_cost(Order order) const;

  std::shared_ptr<const PoolSource> keep(const KeepIndex &index) const;
  std::shared_ptr<const PoolSource> highest(int keep, int drop = 0) const;
  std::shared_ptr<const PoolSource> lowest(int keep, int drop = 0) const;
  std::shared_ptr<const PoolSource> middle(int keep,
                                           MiddleTie tie = MiddleTie::Error) const;
  std::shared_ptr<const PoolSource> multiply_counts(int factor) const;

private:
  std::shared_ptr<const PoolSource>
  with_keep_tuple(std::vector<int> keep_tuple) const;
  std::shared_ptr<const PoolSource>
  apply_keep_tuple(const std::vector<int> &apply) const;

  std::vector<PoolDie> dice_;
  std::vector<Outcome> outcomes_;
  std::vector<int> keep_tuple_;
  Weight denominator_{1};
};

using PoolPtr = std::shared_ptr<const PoolSource>;

PoolPtr make_pool(const std::vector<Die> &dice);
PoolPtr make_pool(const Die &die, int count);

// Fixed multiset: each element is a die with a single outcome.
PoolPtr multiset_literal(const std::vector<Outcome> &elements);

} // namespace rollr
