#pragma once

#include <cstdint>
#include <vector>

#include "types.h"

namespace rollr {

Weight comb(std::int64_t n, std::int64_t k);

// C(n, k) * weight^k for k = 0..n.
std::vector<Weight> comb_row(int n, const Weight &weight = 1);

// total! / prod(part!) where total is the sum of parts.
Weight multinomial(const std::vector<int> &parts);

Weight weight_pow(const Weight &base, unsigned exponent);
Weight weight_gcd(const Weight &a, const Weight &b);
Weight weight_lcm(const Weight &a, const Weight &b);

struct HandSplit {
  std::vector<int> counts;
  Weight weight{1};
};

// Every way to place `total` identical cards into hands with the given
// remaining capacities, weighted by multinomial(total; counts).
std::vector<HandSplit> hand_splits(int total, const std::vector<int> &capacity);

} // namespace rollr
