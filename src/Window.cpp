#include "decorr/preprocess/Window.hpp"

#include <cmath>

#include "decorr/core/Errors.hpp"

namespace decorr::preprocess::detail {

void check_window(const std::string& who, const Window& w) {
  if (w.step && *w.step == 0) {
    throw ValidationError(who + ": step must be >= 1");
  }
  if (w.lower && w.upper && *w.lower > *w.upper) {
    throw ValidationError(who + ": lower bound exceeds upper bound");
  }
}

std::string describe_state(const LambdaState& s) {
  return s.empty() ? std::string("(unlabeled)") : s.to_string();
}

void require_finite_times(const std::string& who, const TimeIndex& index) {
  for (std::size_t r = 0; r < index.size(); ++r) {
    if (!std::isfinite(index.time(r))) {
      throw OrderingError(who + ": time index holds a non-finite value at row " + std::to_string(r) + " in state " +
                          describe_state(index.state(r)));
    }
  }
}

void require_ordered(const std::string& who, const TimeIndex& index,
                     std::span<const std::size_t> rows, bool allow_duplicates) {
  for (std::size_t k = 0; k < rows.size(); ++k) {
    if (!std::isfinite(index.time(rows[k]))) {
      throw OrderingError(who + ": time index holds a non-finite value in state " +
                          describe_state(index.state(rows[k])));
    }
  }
  for (std::size_t k = 1; k < rows.size(); ++k) {
    const double prev = index.time(rows[k - 1]);
    const double cur = index.time(rows[k]);
    if (cur < prev) {
      throw OrderingError(who + ": time index is not sorted ascending in state " +
                          describe_state(index.state(rows[k])) + " (t=" + std::to_string(cur) +
                          " follows t=" + std::to_string(prev) + ")");
    }
    if (cur == prev && !allow_duplicates) {
      throw OrderingError(who + ": duplicate time value t=" + std::to_string(cur) + " in state " +
                          describe_state(index.state(rows[k])));
    }
  }
}

std::vector<std::size_t> window_positions(const TimeSeriesTable& table,
                                          std::span<const std::size_t> rows,
                                          const Window& w) {
  const std::size_t step = w.step ? *w.step : 1;
  std::vector<std::size_t> out;
  std::size_t in_bounds = 0;
  for (std::size_t k = 0; k < rows.size(); ++k) {
    const double t = table.time(rows[k]);
    if (w.lower && t < *w.lower) continue;
    if (w.upper && t > *w.upper) continue;
    const bool on_stride = (in_bounds % step) == 0;
    ++in_bounds;
    if (!on_stride) continue;
    if (table.row_has_missing(rows[k])) continue;
    out.push_back(k);
  }
  return out;
}

} // namespace decorr::preprocess::detail
