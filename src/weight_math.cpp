#include "weight_math.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace rollr {
namespace {

void fill_splits(int remaining, std::size_t hand,
                 const std::vector<int> &capacity, std::vector<int> &counts,
                 std::vector<HandSplit> &out) {
  if (hand + 1 == capacity.size()) {
    if (remaining > capacity[hand]) {
      return;
    }
    counts[hand] = remaining;
    HandSplit split;
    split.counts = counts;
    split.weight = multinomial(counts);
    out.push_back(std::move(split));
    return;
  }
  int upper = std::min(remaining, capacity[hand]);
  for (int c = 0; c <= upper; ++c) {
    counts[hand] = c;
    fill_splits(remaining - c, hand + 1, capacity, counts, out);
  }
}

} // namespace

Weight comb(std::int64_t n, std::int64_t k) {
  if (k < 0 || n < 0 || k > n) {
    return 0;
  }
  if (k > n - k) {
    k = n - k;
  }
  Weight result = 1;
  for (std::int64_t i = 1; i <= k; ++i) {
    result *= n - k + i;
    result /= i;
  }
  return result;
}

std::vector<Weight> comb_row(int n, const Weight &weight) {
  if (n < 0) {
    throw std::invalid_argument("comb_row: n must be non-negative");
  }
  std::vector<Weight> row;
  row.reserve(static_cast<std::size_t>(n) + 1);
  Weight binom = 1;
  Weight power = 1;
  for (int k = 0; k <= n; ++k) {
    row.push_back(binom * power);
    binom *= n - k;
    binom /= k + 1;
    power *= weight;
  }
  return row;
}

Weight multinomial(const std::vector<int> &parts) {
  Weight result = 1;
  std::int64_t total = 0;
  for (int part : parts) {
    if (part < 0) {
      throw std::invalid_argument("multinomial: parts must be non-negative");
    }
    total += part;
    result *= comb(total, part);
  }
  return result;
}

Weight weight_pow(const Weight &base, unsigned exponent) {
  return boost::multiprecision::pow(base, exponent);
}

Weight weight_gcd(const Weight &a, const Weight &b) {
  return boost::multiprecision::gcd(a, b);
}

Weight weight_lcm(const Weight &a, const Weight &b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  return a / weight_gcd(a, b) * b;
}

std::vector<HandSplit> hand_splits(int total,
                                   const std::vector<int> &capacity) {
  std::vector<HandSplit> out;
  if (capacity.empty()) {
    if (total == 0) {
      out.push_back(HandSplit{});
    }
    return out;
  }
  std::vector<int> counts(capacity.size(), 0);
  fill_splits(total, 0, capacity, counts, out);
  return out;
}

} // namespace rollr
