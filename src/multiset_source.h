#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "order.h"
#include "types.h"

namespace rollr {

class MultisetSource;
using SourcePtr = std::shared_ptr<const MultisetSource>;

// One branch of popping a single outcome from a source.
struct SourcePop {
  SourcePtr next;
  std::vector<int> counts;
  Weight weight{1};
};

enum class SourceKind : std::uint8_t { Pool = 0, Deal = 1, Alignment = 2 };

// Immutable random multiset consumed one outcome at a time. Instances are
// always owned by shared_ptr so that pops can return the source itself.
class MultisetSource : public std::enable_shared_from_this<MultisetSource> {
public:
  virtual ~MultisetSource() = default;

  virtual SourceKind kind() const = 0;

  // Remaining outcome domain, ascending.
  virtual const std::vector<Outcome> &outcomes() const = 0;

  // Number of count slots fed to the evaluation.
  virtual int output_arity() const { return 1; }

  // Elements produced by each slot, -1 where unknown.
  virtual std::vector<int> slot_sizes() const = 0;

  // Total weight over all remaining paths.
  virtual Weight denominator() const = 0;

  virtual bool is_resolvable() const { return true; }

  virtual OrderPreference order_preference() const { return {}; }

  // Branches for `outcome`. When `outcome` is not the extreme of the
  // remaining domain in `order` the only branch is (self, zeros, 1).
  virtual std::vector<SourcePop> pop(Order order, Outcome outcome) const = 0;

  // Canonical content encoding; equal keys mean equal sources.
  const std::string &key() const { return key_; }
  std::size_t hash() const { return hash_; }
  bool equals(const MultisetSource &other) const {
    return hash_ == other.hash_ && key_ == other.key_;
  }

  bool exhausted() const { return outcomes().empty(); }
  std::optional<Outcome> extreme_outcome(Order order) const;

protected:
  void set_key(std::string key);
  SourcePop unchanged_pop() const;

private:
  std::string key_;
  std::size_t hash_{0};
};

struct SourcePtrHash {
  std::size_t operator()(const SourcePtr &source) const {
    return source->hash();
  }
};

struct SourcePtrEqual {
  bool operator()(const SourcePtr &a, const SourcePtr &b) const {
    return a == b || a->equals(*b);
  }
};

std::vector<Outcome> sorted_union(const std::vector<Outcome> &a,
                                  const std::vector<Outcome> &b);

std::string outcomes_key(const std::vector<Outcome> &outcomes);

} // namespace rollr
