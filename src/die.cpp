#include "die.h"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "weight_math.h"

namespace rollr {
namespace {

double to_double(const Weight &w) { return w.convert_to<double>(); }

struct DieInputVisitor {
  Die operator()(Outcome outcome) const {
    return Die::from_pairs({{outcome, Weight(1)}});
  }

  Die operator()(const std::vector<DieEntry> &entries) const {
    std::vector<Die> parts;
    parts.reserve(entries.size());
    for (const auto &entry : entries) {
      if (const auto *outcome = std::get_if<Outcome>(&entry)) {
        parts.push_back(Die::from_pairs({{*outcome, Weight(1)}}));
      } else {
        parts.push_back(std::get<Die>(entry));
      }
    }
    return die_mixture(parts);
  }

  Die operator()(const std::map<Outcome, Weight> &mapping) const {
    std::vector<Die::item_type> pairs(mapping.begin(), mapping.end());
    return Die::from_pairs(std::move(pairs));
  }

  Die operator()(const Die &die) const { return die; }
};

} // namespace

Die make_die(const DieInput &input) {
  return std::visit(DieInputVisitor{}, input);
}

Die die_mixture(const std::vector<Die> &parts,
                const std::vector<Weight> &weights) {
  if (!weights.empty() && weights.size() != parts.size()) {
    throw std::invalid_argument(
        "die_mixture: weights must match the number of parts");
  }
  Weight common = 1;
  for (const Die &part : parts) {
    if (!part.empty()) {
      common = weight_lcm(common, part.denominator());
    }
  }
  std::vector<Die::item_type> pairs;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const Die &part = parts[i];
    if (part.empty()) {
      continue;
    }
    Weight factor = common / part.denominator();
    if (!weights.empty()) {
      factor *= weights[i];
    }
    for (const auto &item : part.items()) {
      pairs.emplace_back(item.first, item.second * factor);
    }
  }
  return Die::accumulate(std::move(pairs));
}

Die standard_die(int sides) {
  if (sides < 0) {
    throw std::invalid_argument("standard_die: sides must be non-negative");
  }
  std::vector<Die::item_type> pairs;
  pairs.reserve(static_cast<std::size_t>(sides));
  for (int i = 1; i <= sides; ++i) {
    pairs.emplace_back(i, Weight(1));
  }
  return Die::from_pairs(std::move(pairs));
}

Die die_map(const Die &die, const OutcomeMapFn &fn) {
  std::vector<Die::item_type> pairs;
  pairs.reserve(die.size());
  for (const auto &item : die.items()) {
    std::optional<Outcome> mapped = fn(item.first);
    if (mapped) {
      pairs.emplace_back(*mapped, item.second);
    }
  }
  return Die::accumulate(std::move(pairs));
}

Die die_apply(const Die &left, const Die &right, const OutcomeBinaryFn &fn) {
  std::vector<Die::item_type> pairs;
  pairs.reserve(left.size() * right.size());
  for (const auto &a : left.items()) {
    for (const auto &b : right.items()) {
      std::optional<Outcome> mapped = fn(a.first, b.first);
      if (mapped) {
        pairs.emplace_back(*mapped, a.second * b.second);
      }
    }
  }
  return Die::accumulate(std::move(pairs));
}

Die die_add(const Die &left, const Die &right) {
  return die_apply(left, right, [](Outcome a, Outcome b) {
    return std::optional<Outcome>(a + b);
  });
}

double die_mean(const Die &die) {
  if (die.empty()) {
    throw std::domain_error("die_mean: empty die");
  }
  Weight numerator = 0;
  for (const auto &item : die.items()) {
    numerator += item.second * item.first;
  }
  return to_double(numerator) / to_double(die.denominator());
}

double die_variance(const Die &die) {
  if (die.empty()) {
    throw std::domain_error("die_variance: empty die");
  }
  const Weight denominator = die.denominator();
  Weight sum = 0;
  Weight sum_sq = 0;
  for (const auto &item : die.items()) {
    sum += item.second * item.first;
    sum_sq += item.second * item.first * item.first;
  }
  // Exact numerator of the population variance over denominator^2.
  Weight numerator = sum_sq * denominator - sum * sum;
  return to_double(numerator) / to_double(denominator * denominator);
}

double die_probability(const Die &die, Outcome outcome) {
  if (die.empty()) {
    throw std::domain_error("die_probability: empty die");
  }
  return to_double(die[outcome]) / to_double(die.denominator());
}

std::string die_key(const Die &die) {
  std::ostringstream out;
  out << '{';
  for (std::size_t i = 0; i < die.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << die.key(i) << ':' << die.value(i);
  }
  out << '}';
  return out.str();
}

} // namespace rollr
