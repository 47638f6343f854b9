#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rollr {

struct KeepSlice {
  std::optional<int> start;
  std::optional<int> stop;
  std::optional<int> step;
};

// One element of a sequence index; nullopt stands for an ellipsis.
using KeepSequenceItem = std::optional<int>;
using KeepSequence = std::vector<KeepSequenceItem>;

using KeepIndex = std::variant<int, KeepSlice, KeepSequence>;

inline constexpr KeepSequenceItem kEllipsis = std::nullopt;

// Per-rank multipliers (ascending ranks) for a pool of `size` dice.
std::vector<int> make_keep_tuple(int size, const KeepIndex &index);

// Applies `apply` to the elements already selected by `base`.
std::vector<int> compose_keep_tuples(const std::vector<int> &base,
                                     const std::vector<int> &apply);

// Consumes `count` ranks from the low end. Returns the remaining tuple and
// the sum of the consumed entries.
std::pair<std::vector<int>, int>
pop_min_from_keep_tuple(const std::vector<int> &keep_tuple, int count);
std::pair<std::vector<int>, int>
pop_max_from_keep_tuple(const std::vector<int> &keep_tuple, int count);

// Keep tuples for highest(keep, drop) and lowest(keep, drop).
std::vector<int> highest_keep_tuple(int size, int keep, int drop);
std::vector<int> lowest_keep_tuple(int size, int keep, int drop);

enum class MiddleTie : std::uint8_t { Error = 0, High = 1, Low = 2 };

std::vector<int> middle_keep_tuple(int size, int keep, MiddleTie tie);

std::string keep_tuple_key(const std::vector<int> &keep_tuple);

} // namespace rollr
