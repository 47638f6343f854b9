#pragma once

#include <cstdint>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace rollr {

using Outcome = std::int64_t;
using Weight = boost::multiprecision::cpp_int;

// Accumulator threaded through expression nodes and evaluators.
using EvalState = std::vector<std::int64_t>;

} // namespace rollr
