#include "keep_tuple.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace rollr {
namespace {

int normalize_index(int size, int index) {
  int resolved = index < 0 ? index + size : index;
  if (resolved < 0 || resolved >= size) {
    throw std::out_of_range("keep index " + std::to_string(index) +
                            " out of range for " + std::to_string(size) +
                            " dice");
  }
  return resolved;
}

int clamp_slice_bound(int size, int bound) {
  int resolved = bound < 0 ? bound + size : bound;
  return std::max(0, std::min(size, resolved));
}

std::vector<int> keep_from_slice(int size, const KeepSlice &slice) {
  if (slice.step && *slice.step != 1) {
    throw std::out_of_range("keep slices do not support a step");
  }
  int start = slice.start ? clamp_slice_bound(size, *slice.start) : 0;
  int stop = slice.stop ? clamp_slice_bound(size, *slice.stop) : size;
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  for (int i = start; i < stop; ++i) {
    out[static_cast<std::size_t>(i)] = 1;
  }
  return out;
}

std::vector<int> align_left(int size, const std::vector<int> &items) {
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  for (std::size_t i = 0; i < items.size() && i < out.size(); ++i) {
    out[i] = items[i];
  }
  return out;
}

std::vector<int> align_right(int size, const std::vector<int> &items) {
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  std::size_t n = out.size();
  std::size_t m = items.size();
  for (std::size_t i = 0; i < m && i < n; ++i) {
    out[n - 1 - i] = items[m - 1 - i];
  }
  return out;
}

std::vector<int> keep_from_sequence(int size, const KeepSequence &sequence) {
  std::vector<int> values;
  int ellipsis_at = -1;
  for (std::size_t i = 0; i < sequence.size(); ++i) {
    if (!sequence[i]) {
      if (ellipsis_at >= 0) {
        throw std::out_of_range("keep index may contain at most one ellipsis");
      }
      ellipsis_at = static_cast<int>(i);
    } else {
      values.push_back(*sequence[i]);
    }
  }
  if (ellipsis_at < 0) {
    if (static_cast<int>(values.size()) != size) {
      throw std::out_of_range("keep sequence of length " +
                              std::to_string(values.size()) +
                              " does not match pool size " +
                              std::to_string(size));
    }
    return values;
  }
  std::vector<int> left(values.begin(), values.begin() + ellipsis_at);
  std::vector<int> right(values.begin() + ellipsis_at, values.end());
  if (right.empty()) {
    return align_left(size, left);
  }
  if (left.empty()) {
    return align_right(size, right);
  }
  if (static_cast<int>(values.size()) <= size) {
    std::vector<int> out(static_cast<std::size_t>(size), 0);
    std::copy(left.begin(), left.end(), out.begin());
    std::copy(right.begin(), right.end(), out.end() - right.size());
    return out;
  }
  // Both sides overlap: the overlapping ranks receive both multipliers.
  std::vector<int> out = align_left(size, left);
  std::vector<int> tail = align_right(size, right);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] += tail[i];
  }
  return out;
}

struct KeepIndexVisitor {
  int size;

  std::vector<int> operator()(int index) const {
    std::vector<int> out(static_cast<std::size_t>(size), 0);
    out[static_cast<std::size_t>(normalize_index(size, index))] = 1;
    return out;
  }

  std::vector<int> operator()(const KeepSlice &slice) const {
    return keep_from_slice(size, slice);
  }

  std::vector<int> operator()(const KeepSequence &sequence) const {
    return keep_from_sequence(size, sequence);
  }
};

} // namespace

std::vector<int> make_keep_tuple(int size, const KeepIndex &index) {
  if (size < 0) {
    throw std::out_of_range("keep tuple size must be non-negative");
  }
  return std::visit(KeepIndexVisitor{size}, index);
}

std::vector<int> compose_keep_tuples(const std::vector<int> &base,
                                     const std::vector<int> &apply) {
  std::vector<int> out;
  out.reserve(base.size());
  std::size_t cursor = 0;
  for (int x : base) {
    if (x < 0) {
      throw std::out_of_range("cannot compose a keep tuple with negative "
                              "entries");
    }
    int total = 0;
    for (int i = 0; i < x && cursor < apply.size(); ++i, ++cursor) {
      total += apply[cursor];
    }
    out.push_back(total);
  }
  return out;
}

std::pair<std::vector<int>, int>
pop_min_from_keep_tuple(const std::vector<int> &keep_tuple, int count) {
  if (count <= 0) {
    return {keep_tuple, 0};
  }
  std::size_t n = std::min(keep_tuple.size(), static_cast<std::size_t>(count));
  int total = std::accumulate(keep_tuple.begin(), keep_tuple.begin() + n, 0);
  return {std::vector<int>(keep_tuple.begin() + n, keep_tuple.end()), total};
}

std::pair<std::vector<int>, int>
pop_max_from_keep_tuple(const std::vector<int> &keep_tuple, int count) {
  if (count <= 0) {
    return {keep_tuple, 0};
  }
  std::size_t n = std::min(keep_tuple.size(), static_cast<std::size_t>(count));
  std::size_t split = keep_tuple.size() - n;
  int total = std::accumulate(keep_tuple.begin() + split, keep_tuple.end(), 0);
  return {std::vector<int>(keep_tuple.begin(), keep_tuple.begin() + split),
          total};
}

std::vector<int> highest_keep_tuple(int size, int keep, int drop) {
  if (keep < 0 || drop < 0) {
    throw std::out_of_range("highest: keep and drop must be non-negative");
  }
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  int stop = size - drop;
  int start = std::max(0, stop - keep);
  for (int i = start; i < stop; ++i) {
    out[static_cast<std::size_t>(i)] = 1;
  }
  return out;
}

std::vector<int> lowest_keep_tuple(int size, int keep, int drop) {
  if (keep < 0 || drop < 0) {
    throw std::out_of_range("lowest: keep and drop must be non-negative");
  }
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  int stop = std::min(size, drop + keep);
  for (int i = drop; i < stop; ++i) {
    out[static_cast<std::size_t>(i)] = 1;
  }
  return out;
}

std::vector<int> middle_keep_tuple(int size, int keep, MiddleTie tie) {
  if (keep < 0) {
    throw std::out_of_range("middle: keep must be non-negative");
  }
  if (keep >= size) {
    return std::vector<int>(static_cast<std::size_t>(size), 1);
  }
  int slack = size - keep;
  int start = slack / 2;
  if (slack % 2 == 1) {
    switch (tie) {
    case MiddleTie::High:
      start += 1;
      break;
    case MiddleTie::Low:
      break;
    default:
      throw std::out_of_range("middle: cannot center " + std::to_string(keep) +
                              " of " + std::to_string(size) + " dice");
    }
  }
  std::vector<int> out(static_cast<std::size_t>(size), 0);
  for (int i = start; i < start + keep; ++i) {
    out[static_cast<std::size_t>(i)] = 1;
  }
  return out;
}

std::string keep_tuple_key(const std::vector<int> &keep_tuple) {
  std::ostringstream out;
  out << '(';
  for (std::size_t i = 0; i < keep_tuple.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << keep_tuple[i];
  }
  out << ')';
  return out.str();
}

} // namespace rollr
