#include "deal.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "weight_math.h"

namespace rollr {

DealSource::DealSource(Die deck, std::vector<int> hand_sizes)
    : deck_(std::move(deck)), hand_sizes_(std::move(hand_sizes)),
      outcomes_(deck_.keys()) {
  Weight size = deck_.denominator();
  if (size > Weight(INT32_MAX)) {
    throw std::invalid_argument("deal: deck is too large");
  }
  deck_size_ = size.convert_to<std::int64_t>();
  for (int hand : hand_sizes_) {
    if (hand < 0) {
      throw std::invalid_argument("deal: hand sizes must be non-negative");
    }
  }
  if (total_dealt() > deck_size_) {
    throw std::invalid_argument("deal: cannot deal " +
                                std::to_string(total_dealt()) +
                                " cards from a deck of " +
                                std::to_string(deck_size_));
  }
  denominator_ = comb(deck_size_, total_dealt()) * multinomial(hand_sizes_);

  std::ostringstream key;
  key << "deal{" << die_key(deck_) << ';';
  for (int hand : hand_sizes_) {
    key << hand << ',';
  }
  key << '}';
  set_key(key.str());
}

int DealSource::total_dealt() const {
  int total = 0;
  for (int hand : hand_sizes_) {
    total += hand;
  }
  return total;
}

std::vector<SourcePop> DealSource::pop(Order order, Outcome outcome) const {
  std::vector<SourcePop> out;
  std::optional<Outcome> extreme = extreme_outcome(order);
  if (!extreme || *extreme != outcome) {
    out.push_back(unchanged_pop());
    return out;
  }
  auto popped = order == Order::Descending ? deck_.pop_max() : deck_.pop_min();
  const std::int64_t deck_count = popped.second.convert_to<std::int64_t>();
  const std::int64_t dealt = total_dealt();
  const std::int64_t min_count =
      std::max<std::int64_t>(0, deck_count + dealt - deck_size_);
  const std::int64_t max_count = std::min(deck_count, dealt);
  for (std::int64_t k = min_count; k <= max_count; ++k) {
    Weight deck_weight = comb(deck_count, k);
    for (HandSplit &split : hand_splits(static_cast<int>(k), hand_sizes_)) {
      std::vector<int> next_hands = hand_sizes_;
      for (std::size_t h = 0; h < next_hands.size(); ++h) {
        next_hands[h] -= split.counts[h];
      }
      SourcePop branch;
      branch.next =
          std::make_shared<const DealSource>(popped.first, std::move(next_hands));
      branch.counts = std::move(split.counts);
      branch.weight = deck_weight * split.weight;
      out.push_back(std::move(branch));
    }
  }
  return out;
}

Die make_deck(const std::vector<Outcome> &ranks, int times) {
  if (times < 0) {
    throw std::invalid_argument("make_deck: times must be non-negative");
  }
  std::vector<Die::item_type> pairs;
  pairs.reserve(ranks.size());
  for (Outcome rank : ranks) {
    pairs.emplace_back(rank, Weight(times));
  }
  return Die::from_pairs(std::move(pairs));
}

DealPtr make_deal(const Die &deck, int hand_size) {
  return std::make_shared<const DealSource>(deck, std::vector<int>{hand_size});
}

DealPtr make_deal(const Die &deck, const std::vector<int> &hand_sizes) {
  if (hand_sizes.empty()) {
    throw std::invalid_argument("make_deal: at least one hand is required");
  }
  return std::make_shared<const DealSource>(deck, hand_sizes);
}

} // namespace rollr
