#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "types.h"

namespace rollr {

enum class ZeroWeights : std::uint8_t { Drop = 0, Keep = 1 };

// Immutable key -> weight mapping with keys sorted ascending.
template <typename K> class Counts {
public:
  using key_type = K;
  using item_type = std::pair<K, Weight>;

  Counts() = default;

  // Duplicate keys and negative weights are rejected.
  static Counts from_pairs(std::vector<item_type> pairs,
                           ZeroWeights zero = ZeroWeights::Drop) {
    std::sort(pairs.begin(), pairs.end(),
              [](const item_type &a, const item_type &b) {
                return a.first < b.first;
              });
    Counts out;
    out.items_.reserve(pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
      if (i > 0 && !(pairs[i - 1].first < pairs[i].first)) {
        throw std::invalid_argument("Counts: duplicate key");
      }
      if (pairs[i].second < 0) {
        throw std::invalid_argument("Counts: negative weight");
      }
      if (pairs[i].second == 0 && zero == ZeroWeights::Drop) {
        continue;
      }
      out.items_.push_back(std::move(pairs[i]));
    }
    return out;
  }

  // Sums the weights of repeated keys.
  static Counts accumulate(std::vector<item_type> pairs,
                           ZeroWeights zero = ZeroWeights::Drop) {
    std::sort(pairs.begin(), pairs.end(),
              [](const item_type &a, const item_type &b) {
                return a.first < b.first;
              });
    std::vector<item_type> merged;
    merged.reserve(pairs.size());
    for (auto &pair : pairs) {
      if (!merged.empty() && !(merged.back().first < pair.first)) {
        merged.back().second += pair.second;
      } else {
        merged.push_back(std::move(pair));
      }
    }
    return from_pairs(std::move(merged), zero);
  }

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

  const K &key(std::size_t i) const { return items_.at(i).first; }
  const Weight &value(std::size_t i) const { return items_.at(i).second; }
  const std::vector<item_type> &items() const { return items_; }

  std::vector<K> keys() const {
    std::vector<K> out;
    out.reserve(items_.size());
    for (const auto &item : items_) {
      out.push_back(item.first);
    }
    return out;
  }

  std::vector<Weight> values() const {
    std::vector<Weight> out;
    out.reserve(items_.size());
    for (const auto &item : items_) {
      out.push_back(item.second);
    }
    return out;
  }

  // Missing keys have weight zero.
  Weight operator[](const K &key) const {
    auto it = find(key);
    return it == items_.end() ? Weight(0) : it->second;
  }

  bool contains(const K &key) const { return find(key) != items_.end(); }

  Weight denominator() const {
    Weight total = 0;
    for (const auto &item : items_) {
      total += item.second;
    }
    return total;
  }

  Counts reduce() const {
    Weight divisor = 0;
    for (const auto &item : items_) {
      divisor = boost::multiprecision::gcd(divisor, item.second);
    }
    if (divisor <= 1) {
      return *this;
    }
    Counts out;
    out.items_.reserve(items_.size());
    for (const auto &item : items_) {
      out.items_.emplace_back(item.first, item.second / divisor);
    }
    return out;
  }

  Counts scale(const Weight &factor) const {
    Counts out;
    if (factor == 0) {
      return out;
    }
    out.items_.reserve(items_.size());
    for (const auto &item : items_) {
      out.items_.emplace_back(item.first, item.second * factor);
    }
    return out;
  }

  const K &min_key() const {
    if (items_.empty()) {
      throw std::out_of_range("Counts: min_key of empty mapping");
    }
    return items_.front().first;
  }

  const K &max_key() const {
    if (items_.empty()) {
      throw std::out_of_range("Counts: max_key of empty mapping");
    }
    return items_.back().first;
  }

  // Returns the mapping without its lowest key and that key's weight.
  std::pair<Counts, Weight> pop_min() const {
    if (items_.empty()) {
      throw std::out_of_range("Counts: pop_min of empty mapping");
    }
    Counts rest;
    rest.items_.assign(items_.begin() + 1, items_.end());
    return {std::move(rest), items_.front().second};
  }

  std::pair<Counts, Weight> pop_max() const {
    if (items_.empty()) {
      throw std::out_of_range("Counts: pop_max of empty mapping");
    }
    Counts rest;
    rest.items_.assign(items_.begin(), items_.end() - 1);
    return {std::move(rest), items_.back().second};
  }

  std::size_t hash() const {
    std::size_t seed = items_.size();
    for (const auto &item : items_) {
      boost::hash_combine(seed, item.first);
      boost::hash_combine(seed, item.second);
    }
    return seed;
  }

  bool operator==(const Counts &other) const { return items_ == other.items_; }
  bool operator!=(const Counts &other) const { return !(*this == other); }

private:
  typename std::vector<item_type>::const_iterator find(const K &key) const {
    auto it = std::lower_bound(items_.begin(), items_.end(), key,
                               [](const item_type &item, const K &k) {
                                 return item.first < k;
                               });
    if (it != items_.end() && !(key < it->first)) {
      return it;
    }
    return items_.end();
  }

  std::vector<item_type> items_;
};

template <typename K> struct CountsHash {
  std::size_t operator()(const Counts<K> &counts) const {
    return counts.hash();
  }
};

} // namespace rollr
