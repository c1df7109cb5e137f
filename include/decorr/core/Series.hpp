#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "decorr/core/TimeIndex.hpp"

namespace decorr {

// Scalar value per (time, state) row; the reference series of a decorrelation.
class Series {
public:
  Series() = default;
  explicit Series(std::string name) : name_(std::move(name)) {}

  Series(std::string name, TimeIndex index, std::vector<double> values)
      : name_(std::move(name)), index_(std::move(index)), values_(std::move(values)) {
    if (values_.size() != index_.size()) {
      throw std::runtime_error("Series: values/index length mismatch");
    }
  }

  const std::string& name() const { return name_; }
  std::size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  const TimeIndex& index() const { return index_; }
  double time(std::size_t row) const { return index_.time(row); }
  const LambdaState& state(std::size_t row) const { return index_.state(row); }

  double value(std::size_t row) const { return values_[row]; }
  std::span<const double> values() const { return {values_.data(), values_.size()}; }

  void append(double t, const LambdaState& state, double v) {
    index_.push_back(t, index_.ensure_state(state));
    values_.push_back(v);
  }

  Series take(std::span<const std::size_t> rows) const {
    std::vector<double> v;
    v.reserve(rows.size());
    for (std::size_t r : rows) v.push_back(values_.at(r));
    return Series(name_, index_.take(rows), std::move(v));
  }

  // Same rows in reverse storage order.
  Series reversed() const {
    std::vector<std::size_t> rows(size());
    for (std::size_t i = 0; i < rows.size(); ++i) rows[i] = rows.size() - 1 - i;
    return take(rows);
  }

private:
  std::string name_;
  TimeIndex index_;
  std::vector<double> values_;
};

} // namespace decorr
