#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <variant>
#include <vector>

#include "die.h"

namespace rollr {

enum class AgainOp : std::uint8_t {
  Placeholder = 0,
  Constant = 1,
  Add = 2,
  Subtract = 3,
  Multiply = 4,
  Negate = 5
};

struct AgainExpr;
using AgainExprPtr = std::shared_ptr<const AgainExpr>;

// Arithmetic over the "roll again" placeholder. Each placeholder stands for
// an independent roll of the die being built.
struct AgainExpr {
  AgainOp op{AgainOp::Placeholder};
  Outcome constant{0};
  std::vector<AgainExprPtr> children;
};

AgainExprPtr again();
AgainExprPtr again_constant(Outcome value);
AgainExprPtr again_add(AgainExprPtr left, AgainExprPtr right);
AgainExprPtr again_subtract(AgainExprPtr left, AgainExprPtr right);
AgainExprPtr again_multiply(AgainExprPtr left, AgainExprPtr right);
AgainExprPtr again_negate(AgainExprPtr operand);

// `outcome + again()`.
AgainExprPtr again_plus(Outcome outcome);

// Tuple-valued outcome. Only used to reject placeholders inside tuples.
struct AgainTuple {
  std::vector<std::variant<Outcome, AgainExprPtr>> items;
};

using AgainEntry = std::variant<Outcome, Die, AgainExprPtr, AgainTuple>;

// What a placeholder becomes once the depth limit is reached.
struct AgainEnd {
  enum class Kind : std::uint8_t {
    Default = 0, // zero, when some entry has no placeholder
    Value = 1,
    Reroll = 2,
    Infinity = 3
  };
  Kind kind{Kind::Default};
  Outcome value{0};
};

// Largest representable outcome; saturating arithmetic keeps it fixed.
constexpr Outcome kAgainInfinity = std::numeric_limits<Outcome>::max();

// Builds a die from `entries`, where placeholders roll the die again up to
// `depth` times. `weights` (one per entry, default 1) weight the entries;
// nested dice are scaled so that each entry keeps its share.
Die make_die_with_again(const std::vector<AgainEntry> &entries,
                        const std::vector<Weight> &weights = {}, int depth = 1,
                        AgainEnd end = {});

// Adds another roll whenever the result is in `targets` (by default the
// maximum outcome), at most `depth` extra rolls.
Die explode(const Die &die, std::vector<Outcome> targets = {}, int depth = 9,
            AgainEnd end = {});

} // namespace rollr
