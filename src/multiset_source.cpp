#include "multiset_source.h"

#include <algorithm>
#include <functional>
#include <iterator>
#include <sstream>
#include <utility>

namespace rollr {

std::optional<Outcome> MultisetSource::extreme_outcome(Order order) const {
  const auto &domain = outcomes();
  if (domain.empty()) {
    return std::nullopt;
  }
  return order == Order::Descending ? domain.back() : domain.front();
}

void MultisetSource::set_key(std::string key) {
  key_ = std::move(key);
  hash_ = std::hash<std::string>{}(key_);
}

SourcePop MultisetSource::unchanged_pop() const {
  SourcePop out;
  out.next = shared_from_this();
  out.counts.assign(static_cast<std::size_t>(output_arity()), 0);
  out.weight = 1;
  return out;
}

std::vector<Outcome> sorted_union(const std::vector<Outcome> &a,
                                  const std::vector<Outcome> &b) {
  std::vector<Outcome> out;
  out.reserve(a.size() + b.size());
  std::set_union(a.begin(), a.end(), b.begin(), b.end(),
                 std::back_inserter(out));
  return out;
}

std::string outcomes_key(const std::vector<Outcome> &outcomes) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << outcomes[i];
  }
  out << ']';
  return out.str();
}

} // namespace rollr
