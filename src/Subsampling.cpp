#include "decorr/preprocess/Subsampling.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "decorr/alg/stats/Equilibration.hpp"
#include "decorr/alg/stats/StatisticalInefficiency.hpp"
#include "decorr/core/Errors.hpp"
#include "decorr/util/Parallel.hpp"

namespace decorr::preprocess {

namespace {

enum class Mode {
  Inefficiency,
  Equilibrium,
};

// Rows of one state after the duplicate/sort policy has been applied.
// series_rows is empty when decorrelating without a reference series.
struct Prepared {
  std::vector<std::size_t> table_rows;
  std::vector<std::size_t> series_rows;
};

// Keep the last-seen row of every time value; storage order is preserved.
std::vector<std::size_t> drop_duplicate_times(const TimeIndex& index, const std::vector<std::size_t>& rows) {
  std::unordered_map<double, std::size_t> last;
  last.reserve(rows.size());
  for (std::size_t k = 0; k < rows.size(); ++k) last[index.time(rows[k])] = k;
  std::vector<std::size_t> out;
  out.reserve(last.size());
  for (std::size_t k = 0; k < rows.size(); ++k) {
    if (last[index.time(rows[k])] == k) out.push_back(rows[k]);
  }
  return out;
}

std::vector<std::size_t> normalize_rows(const std::string& who, const TimeIndex& index,
                                        std::vector<std::size_t> rows, const SubsampleOptions& opt) {
  if (opt.drop_duplicates) rows = drop_duplicate_times(index, rows);
  if (opt.sort) {
    std::stable_sort(rows.begin(), rows.end(),
                     [&](std::size_t a, std::size_t b) { return index.time(a) < index.time(b); });
  }
  detail::require_ordered(who, index, rows, false);
  return rows;
}

// Check that the series is keyed like the table and map its state ids onto the
// table's state ids.
std::vector<std::size_t> validate_series(const std::string& who, const TimeSeriesTable& table,
                                         const Series& series, bool sort) {
  if (series.size() != table.size()) {
    throw ValidationError(who + ": series and data must have the same length (" + std::to_string(series.size()) +
                          " vs " + std::to_string(table.size()) + ")");
  }

  const auto& sstates = series.index().states();
  std::vector<std::size_t> remap(sstates.size());
  for (std::size_t s = 0; s < sstates.size(); ++s) {
    auto id = table.index().find_state(sstates[s]);
    if (!id) {
      throw ValidationError(who + ": series holds state " + detail::describe_state(sstates[s]) +
                            " which is not present in the data");
    }
    remap[s] = *id;
  }

  if (!sort) {
    for (std::size_t r = 0; r < table.size(); ++r) {
      if (series.time(r) != table.time(r) || remap[series.index().state_id(r)] != table.index().state_id(r)) {
        throw ValidationError(who + ": series and data must be sampled at the same times (first mismatch at row " +
                              std::to_string(r) + ")");
      }
    }
    return remap;
  }

  using Key = std::pair<std::size_t, double>;
  std::vector<Key> a(table.size());
  std::vector<Key> b(series.size());
  for (std::size_t r = 0; r < table.size(); ++r) a[r] = {table.index().state_id(r), table.time(r)};
  for (std::size_t r = 0; r < series.size(); ++r) b[r] = {remap[series.index().state_id(r)], series.time(r)};
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  if (a != b) {
    throw ValidationError(who + ": series and data must be sampled at the same times");
  }
  return remap;
}

std::vector<Prepared> prepare(const std::string& who, const TimeSeriesTable& table, const Series* series,
                              const SubsampleOptions& opt) {
  detail::check_window(who, opt);
  detail::require_finite_times(who, table.index());
  if (series) detail::require_finite_times(who, series->index());

  std::vector<std::vector<std::size_t>> series_rows_by_state;
  if (series) {
    const auto remap = validate_series(who, table, *series, opt.sort);
    series_rows_by_state.resize(table.index().states().size());
    for (std::size_t r = 0; r < series->size(); ++r) {
      series_rows_by_state[remap[series->index().state_id(r)]].push_back(r);
    }
  }

  std::vector<Prepared> out;
  for (auto& part : table.index().partitions()) {
    Prepared p;
    p.table_rows = normalize_rows(who, table.index(), std::move(part.rows), opt);
    if (series) {
      p.series_rows = normalize_rows(who, series->index(), std::move(series_rows_by_state[part.state_id]), opt);
      bool aligned = (p.series_rows.size() == p.table_rows.size());
      for (std::size_t k = 0; aligned && k < p.table_rows.size(); ++k) {
        aligned = (series->time(p.series_rows[k]) == table.time(p.table_rows[k]));
      }
      if (!aligned) {
        throw ValidationError(who + ": series and data must be sampled at the same times in state " +
                              detail::describe_state(table.index().states()[part.state_id]));
      }
    }
    out.push_back(std::move(p));
  }
  return out;
}

std::vector<std::size_t> select_rows(const std::string& who, const TimeSeriesTable& table, const Series* series,
                                     const Prepared& p, const SubsampleOptions& opt, Mode mode) {
  const auto pos = detail::window_positions(table, p.table_rows, opt);

  std::vector<std::size_t> out;
  if (!series) {
    out.reserve(pos.size());
    for (std::size_t k : pos) out.push_back(p.table_rows[k]);
    return out;
  }

  std::vector<double> ref(pos.size());
  for (std::size_t i = 0; i < pos.size(); ++i) {
    const std::size_t r = p.series_rows[pos[i]];
    ref[i] = series->value(r);
    if (!std::isfinite(ref[i])) {
      throw ValidationError(who + ": reference series is not finite at t=" + std::to_string(series->time(r)) +
                            " in state " + detail::describe_state(series->state(r)));
    }
  }

  std::size_t offset = 0;
  double g = 1.0;
  if (mode == Mode::Inefficiency) {
    g = alg::stats::statistical_inefficiency(ref);
  } else {
    const auto ep = alg::stats::detect_equilibration(ref);
    offset = ep.t0;
    g = ep.g;
  }

  const auto idx = alg::stats::subsample_indices(ref.size() - offset, g, opt.conservative);
  out.reserve(idx.size());
  for (std::size_t i : idx) out.push_back(p.table_rows[pos[offset + i]]);
  return out;
}

TimeSeriesTable run(const std::string& who, const TimeSeriesTable& table, const Series* series,
                    const SubsampleOptions& opt, Mode mode) {
  const auto prepared = prepare(who, table, series, opt);

  // States are independent; recombination below restores enumeration order.
  // A single state stays outside the parallel region so the per-candidate
  // loop of the equilibration search is not nested.
  std::vector<std::vector<std::size_t>> kept(prepared.size());
  if (prepared.size() == 1) {
    kept[0] = select_rows(who, table, series, prepared[0], opt, mode);
  } else {
    util::parallel_for(prepared.size(), [&](std::size_t i) {
      kept[i] = select_rows(who, table, series, prepared[i], opt, mode);
    });
  }

  std::vector<std::size_t> rows;
  for (const auto& k : kept) rows.insert(rows.end(), k.begin(), k.end());
  return table.take(rows);
}

} // namespace

TimeSeriesTable statistical_inefficiency(const TimeSeriesTable& table, const SubsampleOptions& opt) {
  return run("statistical_inefficiency", table, nullptr, opt, Mode::Inefficiency);
}

TimeSeriesTable statistical_inefficiency(const TimeSeriesTable& table, const Series& series,
                                         const SubsampleOptions& opt) {
  return run("statistical_inefficiency", table, &series, opt, Mode::Inefficiency);
}

Series statistical_inefficiency(const Series& data, const Series& series, const SubsampleOptions& opt) {
  const auto table = TimeSeriesTable::from_series(data, TableAttrs{});
  return run("statistical_inefficiency", table, &series, opt, Mode::Inefficiency).column_series(0);
}

TimeSeriesTable equilibrium_detection(const TimeSeriesTable& table, const SubsampleOptions& opt) {
  if (table.n_columns() == 0) {
    throw ValidationError("equilibrium_detection: table has no value columns to use as reference");
  }
  const Series reference = table.column_series(0);
  return run("equilibrium_detection", table, &reference, opt, Mode::Equilibrium);
}

TimeSeriesTable equilibrium_detection(const TimeSeriesTable& table, const Series& series,
                                      const SubsampleOptions& opt) {
  return run("equilibrium_detection", table, &series, opt, Mode::Equilibrium);
}

} // namespace decorr::preprocess
