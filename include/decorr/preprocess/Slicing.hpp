#pragma once

#include "decorr/core/TimeSeriesTable.hpp"
#include "decorr/preprocess/Window.hpp"

namespace decorr::preprocess {

struct SliceOptions : Window {
  // Skip the duplicate-time check. Disorder is still an error.
  bool force = false;
};

// Restrict every state partition to lower <= time <= upper, keep every
// step-th row, and drop rows with missing values.
//
// Throws OrderingError if a partition's time index is not ascending, or holds
// duplicate times (unless opt.force). Partitions are recombined in state
// enumeration order; attrs are copied.
TimeSeriesTable slicing(const TimeSeriesTable& table, const SliceOptions& opt = {});

} // namespace decorr::preprocess
