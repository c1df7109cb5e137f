#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "decorr/core/TimeIndex.hpp"
#include "decorr/core/TimeSeriesTable.hpp"

namespace decorr::preprocess {

// Time window and stride shared by every preprocessing entry point.
struct Window {
  std::optional<double> lower;
  std::optional<double> upper;
  std::optional<std::size_t> step;
};

namespace detail {

// ValidationError on step == 0 or lower > upper.
void check_window(const std::string& who, const Window& w);

// OrderingError if any time of the index is NaN or infinite.
void require_finite_times(const std::string& who, const TimeIndex& index);

// OrderingError unless the times of `rows` are finite and ascending; duplicates
// are tolerated only when allow_duplicates is set.
void require_ordered(const std::string& who, const TimeIndex& index,
                     std::span<const std::size_t> rows, bool allow_duplicates);

// Positions into `rows` that survive, in order: lower <= time <= upper, every
// step-th row counted from the first row inside the bounds, and rows without
// missing (NaN) values.
std::vector<std::size_t> window_positions(const TimeSeriesTable& table,
                                          std::span<const std::size_t> rows,
                                          const Window& w);

std::string describe_state(const LambdaState& s);

} // namespace detail
} // namespace decorr::preprocess
