#include "pool.h"

#include <algorithm>
#include <cstddef>
#include <map>
#include <numeric>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "weight_math.h"

namespace rollr {
namespace {

struct DiePopOption {
  Die popped;
  int misses{0};
  int hits{0};
  Weight weight{1};
};

// All ways `rolls` copies of `die` can roll the extreme outcome.
std::vector<DiePopOption> die_pop_options(const Die &die, int rolls,
                                          Order order, Outcome outcome) {
  std::vector<DiePopOption> out;
  if (die.empty() ||
      (order == Order::Descending ? die.max_key() : die.min_key()) != outcome) {
    DiePopOption option;
    option.popped = die;
    option.misses = rolls;
    out.push_back(std::move(option));
    return out;
  }
  auto popped = order == Order::Descending ? die.pop_max() : die.pop_min();
  if (popped.first.empty()) {
    DiePopOption option;
    option.popped = std::move(popped.first);
    option.hits = rolls;
    option.weight = weight_pow(popped.second, static_cast<unsigned>(rolls));
    out.push_back(std::move(option));
    return out;
  }
  std::vector<Weight> row = comb_row(rolls, popped.second);
  out.reserve(row.size());
  for (int hits = 0; hits <= rolls; ++hits) {
    DiePopOption option;
    option.popped = popped.first;
    option.misses = rolls - hits;
    option.hits = hits;
    option.weight = row[static_cast<std::size_t>(hits)];
    out.push_back(std::move(option));
  }
  return out;
}

std::vector<PoolDie> canonical_dice(std::vector<PoolDie> dice) {
  std::map<std::string, PoolDie> merged;
  for (auto &entry : dice) {
    if (entry.count < 0) {
      throw std::invalid_argument("pool: die counts must be non-negative");
    }
    if (entry.count == 0) {
      continue;
    }
    std::string key = die_key(entry.die);
    auto it = merged.find(key);
    if (it == merged.end()) {
      merged.emplace(std::move(key), std::move(entry));
    } else {
      it->second.count += entry.count;
    }
  }
  std::vector<PoolDie> out;
  out.reserve(merged.size());
  for (auto &kv : merged) {
    out.push_back(std::move(kv.second));
  }
  return out;
}

} // namespace

PoolSource::PoolSource(std::vector<PoolDie> dice, std::vector<Outcome> outcomes,
                       std::vector<int> keep_tuple)
    : dice_(canonical_dice(std::move(dice))), outcomes_(std::move(outcomes)),
      keep_tuple_(std::move(keep_tuple)) {
  if (static_cast<int>(keep_tuple_.size()) != raw_size()) {
    throw std::invalid_argument("pool: keep tuple length " +
                                std::to_string(keep_tuple_.size()) +
                                " does not match " +
                                std::to_string(raw_size()) + " dice");
  }
  for (const auto &entry : dice_) {
    denominator_ *= weight_pow(entry.die.denominator(),
                               static_cast<unsigned>(entry.count));
  }
  std::ostringstream key;
  key << "pool{";
  for (const auto &entry : dice_) {
    key << die_key(entry.die) << '*' << entry.count << ';';
  }
  key << outcomes_key(outcomes_) << keep_tuple_key(keep_tuple_) << '}';
  set_key(key.str());
}

bool PoolSource::is_resolvable() const {
  return std::none_of(dice_.begin(), dice_.end(),
                      [](const PoolDie &entry) { return entry.die.empty(); });
}

OrderPreference PoolSource::order_preference() const {
  std::vector<Die> unique;
  unique.reserve(dice_.size());
  for (const auto &entry : dice_) {
    unique.push_back(entry.die);
  }
  return pool_order_preference(unique, keep_tuple_);
}

int PoolSource::raw_size() const {
  int total = 0;
  for (const auto &entry : dice_) {
    total += entry.count;
  }
  return total;
}

int PoolSource::keep_size() const {
  return std::accumulate(keep_tuple_.begin(), keep_tuple_.end(), 0);
}

bool PoolSource::has_negative_keeps() const {
  return std::any_of(keep_tuple_.begin(), keep_tuple_.end(),
                     [](int x) { return x < 0; });
}

Weight PoolSource::pop_cost(Order order) const {
  std::vector<std::pair<Die, int>> dice;
  dice.reserve(dice_.size());
  for (const auto &entry : dice_) {
    dice.emplace_back(entry.die, entry.count);
  }
  return estimate_pop_cost(dice, order);
}

std::vector<SourcePop> PoolSource::pop(Order order, Outcome outcome) const {
  std::vector<SourcePop> out;
  std::optional<Outcome> extreme = extreme_outcome(order);
  if (!extreme || *extreme != outcome) {
    out.push_back(unchanged_pop());
    return out;
  }
  std::vector<Outcome> next_outcomes =
      order == Order::Descending
          ? std::vector<Outcome>(outcomes_.begin(), outcomes_.end() - 1)
          : std::vector<Outcome>(outcomes_.begin() + 1, outcomes_.end());

  std::vector<std::vector<DiePopOption>> options;
  options.reserve(dice_.size());
  for (const auto &entry : dice_) {
    options.push_back(die_pop_options(entry.die, entry.count, order, outcome));
  }

  std::optional<Weight> skip_weight;
  std::vector<std::size_t> cursor(options.size(), 0);
  while (true) {
    std::vector<PoolDie> next_dice;
    int total_hits = 0;
    Weight weight = 1;
    for (std::size_t i = 0; i < options.size(); ++i) {
      const DiePopOption &option = options[i][cursor[i]];
      if (!option.popped.empty() && option.misses > 0) {
        next_dice.push_back(PoolDie{option.popped, option.misses});
      }
      total_hits += option.hits;
      weight *= option.weight;
    }
    auto popped_keep = order == Order::Descending
                           ? pop_max_from_keep_tuple(keep_tuple_, total_hits)
                           : pop_min_from_keep_tuple(keep_tuple_, total_hits);
    auto next = std::make_shared<const PoolSource>(
        std::move(next_dice), next_outcomes, std::move(popped_keep.first));
    if (std::all_of(next->keep_tuple_.begin(), next->keep_tuple_.end(),
                    [](int x) { return x == 0; })) {
      // The remaining dice cannot contribute; fold them into one branch.
      Weight folded = weight * next->denominator();
      skip_weight = skip_weight ? *skip_weight + folded : folded;
    } else {
      out.push_back(SourcePop{std::move(next), {popped_keep.second}, weight});
    }

    std::size_t i = 0;
    for (; i < cursor.size(); ++i) {
      if (++cursor[i] < options[i].size()) {
        break;
      }
      cursor[i] = 0;
    }
    if (i == cursor.size()) {
      break;
    }
  }

  if (skip_weight) {
    auto empty = std::make_shared<const PoolSource>(
        std::vector<PoolDie>{}, std::move(next_outcomes), std::vector<int>{});
    out.push_back(SourcePop{std::move(empty), {keep_size()}, *skip_weight});
  }
  return out;
}

PoolPtr PoolSource::with_keep_tuple(std::vector<int> keep_tuple) const {
  return std::make_shared<const PoolSource>(dice_, outcomes_,
                                            std::move(keep_tuple));
}

PoolPtr PoolSource::apply_keep_tuple(const std::vector<int> &apply) const {
  if (has_negative_keeps()) {
    throw std::out_of_range(
        "pool: cannot apply a keep to a pool with negative keep entries");
  }
  return with_keep_tuple(compose_keep_tuples(keep_tuple_, apply));
}

PoolPtr PoolSource::keep(const KeepIndex &index) const {
  return apply_keep_tuple(make_keep_tuple(keep_size(), index));
}

PoolPtr PoolSource::highest(int keep, int drop) const {
  return apply_keep_tuple(highest_keep_tuple(keep_size(), keep, drop));
}

PoolPtr PoolSource::lowest(int keep, int drop) const {
  return apply_keep_tuple(lowest_keep_tuple(keep_size(), keep, drop));
}

PoolPtr PoolSource::middle(int keep, MiddleTie tie) const {
  return apply_keep_tuple(middle_keep_tuple(keep_size(), keep, tie));
}

PoolPtr PoolSource::multiply_counts(int factor) const {
  std::vector<int> scaled = keep_tuple_;
  for (int &x : scaled) {
    x *= factor;
  }
  return with_keep_tuple(std::move(scaled));
}

PoolPtr make_pool(const std::vector<Die> &dice) {
  std::vector<PoolDie> entries;
  std::vector<Outcome> outcomes;
  entries.reserve(dice.size());
  for (const Die &die : dice) {
    entries.push_back(PoolDie{die, 1});
    outcomes = sorted_union(outcomes, die.keys());
  }
  std::vector<int> keep(dice.size(), 1);
  return std::make_shared<const PoolSource>(std::move(entries),
                                            std::move(outcomes),
                                            std::move(keep));
}

PoolPtr make_pool(const Die &die, int count) {
  if (count < 0) {
    throw std::invalid_argument("make_pool: count must be non-negative");
  }
  return make_pool(std::vector<Die>(static_cast<std::size_t>(count), die));
}

PoolPtr multiset_literal(const std::vector<Outcome> &elements) {
  std::vector<Die> dice;
  dice.reserve(elements.size());
  for (Outcome outcome : elements) {
    dice.push_back(Die::from_pairs({{outcome, Weight(1)}}));
  }
  return make_pool(dice);
}

} // namespace rollr
