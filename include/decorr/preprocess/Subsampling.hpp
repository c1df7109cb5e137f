#pragma once

#include "decorr/core/Series.hpp"
#include "decorr/core/TimeSeriesTable.hpp"
#include "decorr/preprocess/Window.hpp"

namespace decorr::preprocess {

struct SubsampleOptions : Window {
  // Stride by ceil(g) instead of round(k*g).
  bool conservative = false;
  // Collapse rows sharing a time within a state (last row wins). When off,
  // duplicate times are an OrderingError.
  bool drop_duplicates = true;
  // Reorder by time within each state. When off, an unsorted index is an
  // OrderingError.
  bool sort = false;
};

// Subsample `table` so that the kept rows are approximately uncorrelated with
// respect to `series`.
//
// Per state: the reference series is restricted to the window, its statistical
// inefficiency g is estimated, and rows spaced by g are kept. Without a series
// this reduces to slicing with the same window.
//
// Throws ValidationError if the series does not match the table's (time, state)
// keys (order is ignored only with sort), OrderingError per the
// sort/drop_duplicates policy.
TimeSeriesTable statistical_inefficiency(const TimeSeriesTable& table, const SubsampleOptions& opt = {});
TimeSeriesTable statistical_inefficiency(const TimeSeriesTable& table, const Series& series,
                                         const SubsampleOptions& opt = {});
// Series data: the kept rows of `data`, under the same rules as a one-column table.
Series statistical_inefficiency(const Series& data, const Series& series, const SubsampleOptions& opt = {});

// Like statistical_inefficiency, but first searches each state for the
// equilibration point: the start offset that maximizes the number of
// effectively independent samples. Rows before it are discarded as burn-in.
//
// Without a series the table's first column is the reference.
TimeSeriesTable equilibrium_detection(const TimeSeriesTable& table, const SubsampleOptions& opt = {});
TimeSeriesTable equilibrium_detection(const TimeSeriesTable& table, const Series& series,
                                      const SubsampleOptions& opt = {});

} // namespace decorr::preprocess
