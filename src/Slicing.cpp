#include "decorr/preprocess/Slicing.hpp"

#include <vector>

namespace decorr::preprocess {

TimeSeriesTable slicing(const TimeSeriesTable& table, const SliceOptions& opt) {
  static const std::string who = "slicing";
  detail::check_window(who, opt);

  std::vector<std::size_t> keep;
  keep.reserve(table.size());
  for (const auto& part : table.index().partitions()) {
    // Checked before filtering: a window over a disordered index selects the wrong rows.
    detail::require_ordered(who, table.index(), part.rows, opt.force);
    for (std::size_t k : detail::window_positions(table, part.rows, opt)) {
      keep.push_back(part.rows[k]);
    }
  }
  return table.take(keep);
}

} // namespace decorr::preprocess
