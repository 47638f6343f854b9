#include "alignment.h"

#include <algorithm>
#include <optional>
#include <utility>

namespace rollr {

AlignmentSource::AlignmentSource(std::vector<Outcome> outcomes)
    : outcomes_(std::move(outcomes)) {
  std::sort(outcomes_.begin(), outcomes_.end());
  outcomes_.erase(std::unique(outcomes_.begin(), outcomes_.end()),
                  outcomes_.end());
  set_key("align" + outcomes_key(outcomes_));
}

std::vector<SourcePop> AlignmentSource::pop(Order order,
                                            Outcome outcome) const {
  std::vector<SourcePop> out;
  std::optional<Outcome> extreme = extreme_outcome(order);
  if (!extreme || *extreme != outcome) {
    out.push_back(unchanged_pop());
    return out;
  }
  std::vector<Outcome> rest =
      order == Order::Descending
          ? std::vector<Outcome>(outcomes_.begin(), outcomes_.end() - 1)
          : std::vector<Outcome>(outcomes_.begin() + 1, outcomes_.end());
  out.push_back(SourcePop{make_alignment(std::move(rest)), {0}, 1});
  return out;
}

std::shared_ptr<const AlignmentSource>
make_alignment(std::vector<Outcome> outcomes) {
  return std::make_shared<const AlignmentSource>(std::move(outcomes));
}

} // namespace rollr
