#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "die.h"
#include "multiset_source.h"

namespace rollr {

// Hands dealt without replacement from a deck. The deck maps each outcome
// to the number of cards carrying it.
class DealSource : public MultisetSource {
public:
  DealSource(Die deck, std::vector<int> hand_sizes);

  SourceKind kind() const override { return SourceKind::Deal; }
  const std::vector<Outcome> &outcomes() const override { return outcomes_; }
  int output_arity() const override {
    return static_cast<int>(hand_sizes_.size());
  }
  std::vector<int> slot_sizes() const override { return hand_sizes_; }
  Weight denominator() const override { return denominator_; }
  std::vector<SourcePop> pop(Order order, Outcome outcome) const override;

  const Die &deck() const { return deck_; }
  const std::vector<int> &hand_sizes() const { return hand_sizes_; }
  std::int64_t deck_size() const { return deck_size_; }
  int total_dealt() const;

private:
  Die deck_;
  std::vector<int> hand_sizes_;
  std::vector<Outcome> outcomes_;
  std::int64_t deck_size_{0};
  Weight denominator_{1};
};

using DealPtr = std::shared_ptr<const DealSource>;

// `times` copies of every outcome of `ranks`, weights ignored.
Die make_deck(const std::vector<Outcome> &ranks, int times);

DealPtr make_deal(const Die &deck, int hand_size);
DealPtr make_deal(const Die &deck, const std::vector<int> &hand_sizes);

} // namespace rollr
