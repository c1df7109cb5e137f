#include "decorr/core/TimeSeriesTable.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace decorr {

namespace {

inline std::runtime_error die(const std::string& msg) {
  return std::runtime_error("TimeSeriesTable: " + msg);
}

} // namespace

TimeSeriesTable::TimeSeriesTable(ColumnSchema schema, TableAttrs attrs)
    : schema_(std::move(schema)), values_(schema_.size()), attrs_(attrs) {}

std::span<const double> TimeSeriesTable::column_values(std::size_t col) const {
  if (col >= values_.size()) throw die("column id out of range");
  return {values_[col].data(), values_[col].size()};
}

void TimeSeriesTable::append_row(double t, const LambdaState& state, std::span<const double> values) {
  if (values.size() != values_.size()) {
    throw die("append_row expected " + std::to_string(values_.size()) + " values, got " +
              std::to_string(values.size()));
  }
  index_.push_back(t, index_.ensure_state(state));
  for (std::size_t c = 0; c < values.size(); ++c) values_[c].push_back(values[c]);
}

bool TimeSeriesTable::row_has_missing(std::size_t row) const {
  for (const auto& col : values_) {
    if (std::isnan(col[row])) return true;
  }
  return false;
}

Series TimeSeriesTable::column_series(std::size_t col) const {
  if (col >= values_.size()) throw die("column id out of range");
  return Series(schema_.info(col).name, index_, values_[col]);
}

Series TimeSeriesTable::row_sum() const {
  std::vector<double> sum(size(), 0.0);
  for (const auto& col : values_) {
    for (std::size_t r = 0; r < sum.size(); ++r) sum[r] += col[r];
  }
  return Series("row_sum", index_, std::move(sum));
}

TimeSeriesTable TimeSeriesTable::take(std::span<const std::size_t> rows) const {
  TimeSeriesTable out(schema_, attrs_);
  out.index_ = index_.take(rows);
  for (std::size_t c = 0; c < values_.size(); ++c) {
    auto& dst = out.values_[c];
    dst.reserve(rows.size());
    for (std::size_t r : rows) dst.push_back(values_[c][r]);
  }
  return out;
}

std::vector<std::pair<LambdaState, std::size_t>> TimeSeriesTable::rows_per_state() const {
  std::vector<std::pair<LambdaState, std::size_t>> out;
  for (const auto& p : index_.partitions()) {
    out.emplace_back(index_.states()[p.state_id], p.rows.size());
  }
  return out;
}

bool TimeSeriesTable::operator==(const TimeSeriesTable& o) const {
  if (size() != o.size() || schema_ != o.schema_ || attrs_ != o.attrs_) return false;
  for (std::size_t r = 0; r < size(); ++r) {
    if (time(r) != o.time(r) || state(r) != o.state(r)) return false;
  }
  return values_ == o.values_;
}

TimeSeriesTable TimeSeriesTable::concat(const std::vector<TimeSeriesTable>& parts) {
  if (parts.empty()) return TimeSeriesTable();

  TimeSeriesTable out(parts.front().schema_, parts.front().attrs_);
  std::size_t total = 0;
  for (const auto& p : parts) {
    if (p.schema_ != out.schema_) throw die("concat: column schemas differ");
    if (p.attrs_ != out.attrs_) throw die("concat: attrs (temperature/energy_unit) differ");
    total += p.size();
  }

  out.index_.reserve(total);
  for (auto& col : out.values_) col.reserve(total);

  for (const auto& p : parts) {
    // Remap state ids into the merged dictionary.
    std::vector<std::size_t> remap(p.index_.states().size());
    for (std::size_t s = 0; s < remap.size(); ++s) {
      remap[s] = out.index_.ensure_state(p.index_.states()[s]);
    }
    for (std::size_t r = 0; r < p.size(); ++r) {
      out.index_.push_back(p.index_.time(r), remap[p.index_.state_id(r)]);
    }
    for (std::size_t c = 0; c < out.values_.size(); ++c) {
      out.values_[c].insert(out.values_[c].end(), p.values_[c].begin(), p.values_[c].end());
    }
  }
  return out;
}

TimeSeriesTable TimeSeriesTable::from_series(const Series& series, const TableAttrs& attrs) {
  ColumnSchema schema;
  schema.ensure(series.name().empty() ? std::string("value") : series.name());
  TimeSeriesTable out(std::move(schema), attrs);
  out.index_ = series.index();
  out.values_[0].assign(series.values().begin(), series.values().end());
  return out;
}

} // namespace decorr
