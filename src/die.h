#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "counts.h"
#include "types.h"

namespace rollr {

using Die = Counts<Outcome>;

// One entry of a die written as a sequence: a plain outcome or a nested die
// that contributes with the same total probability as a plain entry.
using DieEntry = std::variant<Outcome, Die>;

using DieInput = std::variant<Outcome, std::vector<DieEntry>,
                              std::map<Outcome, Weight>, Die>;

Die make_die(const DieInput &input);

// Weighted mixture. Each part is scaled to the lcm of the denominators so
// every part carries probability proportional to its weight.
Die die_mixture(const std::vector<Die> &parts,
                const std::vector<Weight> &weights = {});

// Outcomes 1..sides, each with weight 1.
Die standard_die(int sides);

using OutcomeMapFn = std::function<std::optional<Outcome>(Outcome)>;
using OutcomeBinaryFn = std::function<std::optional<Outcome>(Outcome, Outcome)>;

// nullopt from the callback rerolls that outcome.
Die die_map(const Die &die, const OutcomeMapFn &fn);
Die die_apply(const Die &left, const Die &right, const OutcomeBinaryFn &fn);
Die die_add(const Die &left, const Die &right);

double die_mean(const Die &die);
double die_variance(const Die &die);
double die_probability(const Die &die, Outcome outcome);

std::string die_key(const Die &die);

} // namespace rollr
