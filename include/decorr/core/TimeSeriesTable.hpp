#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "decorr/core/ColumnSchema.hpp"
#include "decorr/core/EnergyUnit.hpp"
#include "decorr/core/LambdaState.hpp"
#include "decorr/core/Series.hpp"
#include "decorr/core/TimeIndex.hpp"

namespace decorr {

// Standardized tabular representation of per-state simulation output.
//
// Rows are keyed by (time, state); value columns are stored column-major (SoA)
// so reference series and column sums are contiguous scans. Every table
// carries TableAttrs by value, so a transform that builds its result from
// `take()` or `concat()` copies the metadata instead of sharing it.
//
// Tables are never modified by the preprocessing functions; each one returns
// a new table.
class TimeSeriesTable {
public:
  TimeSeriesTable() = default;
  TimeSeriesTable(ColumnSchema schema, TableAttrs attrs);

  const TableAttrs& attrs() const { return attrs_; }
  void set_attrs(const TableAttrs& attrs) { attrs_ = attrs; }

  const ColumnSchema& schema() const { return schema_; }
  const TimeIndex& index() const { return index_; }

  std::size_t size() const { return index_.size(); }
  bool empty() const { return index_.empty(); }
  std::size_t n_columns() const { return schema_.size(); }

  double time(std::size_t row) const { return index_.time(row); }
  const LambdaState& state(std::size_t row) const { return index_.state(row); }
  double value(std::size_t row, std::size_t col) const { return values_[col][row]; }

  std::span<const double> column_values(std::size_t col) const;

  // values.size() must equal n_columns().
  void append_row(double t, const LambdaState& state, std::span<const double> values);

  // True if any value column holds NaN at `row`.
  bool row_has_missing(std::size_t row) const;

  Series column_series(std::size_t col) const;
  Series column_series(const std::string& name) const { return column_series(schema_.require(name)); }

  // Sum across all value columns per row.
  Series row_sum() const;

  // Same schema and attrs, selected rows in the given order.
  TimeSeriesTable take(std::span<const std::size_t> rows) const;

  // Row count per state, states in enumeration order.
  std::vector<std::pair<LambdaState, std::size_t>> rows_per_state() const;

  // Exact comparison of keys, values, schema and attrs.
  bool operator==(const TimeSeriesTable& o) const;
  bool operator!=(const TimeSeriesTable& o) const { return !(*this == o); }

  // Row-wise concatenation. Schemas and attrs must agree; states are merged by key.
  static TimeSeriesTable concat(const std::vector<TimeSeriesTable>& parts);

  // Single-column table holding the series values.
  static TimeSeriesTable from_series(const Series& series, const TableAttrs& attrs);

private:
  TimeIndex index_;
  ColumnSchema schema_;
  std::vector<std::vector<double>> values_; // [col][row]
  TableAttrs attrs_;
};

} // namespace decorr
