#pragma once

#include <memory>
#include <vector>

#include "multiset_source.h"

namespace rollr {

// Pads the evaluation domain with outcomes that no other source produces.
// Always yields a zero count and carries no probability mass.
class AlignmentSource : public MultisetSource {
public:
  explicit AlignmentSource(std::vector<Outcome> outcomes);

  SourceKind kind() const override { return SourceKind::Alignment; }
  const std::vector<Outcome> &outcomes() const override { return outcomes_; }
  std::vector<int> slot_sizes() const override { return {0}; }
  Weight denominator() const override { return 0; }
  std::vector<SourcePop> pop(Order order, Outcome outcome) const override;

private:
  std::vector<Outcome> outcomes_;
};

std::shared_ptr<const AlignmentSource>
make_alignment(std::vector<Outcome> outcomes);

} // namespace rollr
