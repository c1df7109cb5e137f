#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>
#include <vector>

#include "decorr/core/TimeSeriesTable.hpp"

namespace decorr::test {

inline TableAttrs attrs(double temperature = 300.0, EnergyUnit unit = EnergyUnit::kT) {
  TableAttrs a;
  a.temperature = temperature;
  a.energy_unit = unit;
  return a;
}

inline std::vector<double> white_noise(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> normal(0.0, 1.0);
  std::vector<double> x(n);
  for (auto& v : x) v = normal(rng);
  return x;
}

// x_i = u_i + theta * u_{i-1}
inline std::vector<double> ma1(std::size_t n, double theta, std::uint32_t seed) {
  const auto u = white_noise(n + 1, seed);
  std::vector<double> x(n);
  for (std::size_t i = 0; i < n; ++i) x[i] = u[i + 1] + theta * u[i];
  return x;
}

// x_i = phi * x_{i-1} + u_i, started from the stationary distribution.
inline std::vector<double> ar1(std::size_t n, double phi, std::uint32_t seed) {
  const auto u = white_noise(n, seed);
  std::vector<double> x(n);
  if (n == 0) return x;
  x[0] = u[0] / std::sqrt(1.0 - phi * phi);
  for (std::size_t i = 1; i < n; ++i) x[i] = phi * x[i - 1] + u[i];
  return x;
}

// Decaying transient on top of white noise: 20 * exp(-i/30) + u_i.
inline std::vector<double> with_burnin(std::size_t n, std::uint32_t seed) {
  auto x = white_noise(n, seed);
  for (std::size_t i = 0; i < n; ++i) x[i] += 20.0 * std::exp(-static_cast<double>(i) / 30.0);
  return x;
}

// Derivative table, one column per entry of `columns`, all sampled in `state`
// at times t0, t0+dt, ...
inline TimeSeriesTable dhdl_table(const std::vector<std::vector<double>>& columns,
                                  const std::vector<std::string>& names,
                                  const LambdaState& state = LambdaState::scalar(0.0),
                                  double dt = 1.0, double t0 = 0.0,
                                  const TableAttrs& a = attrs()) {
  ColumnSchema schema;
  for (const auto& n : names) schema.ensure(n);
  TimeSeriesTable t(schema, a);
  const std::size_t n = columns.empty() ? 0 : columns[0].size();
  std::vector<double> row(columns.size());
  for (std::size_t r = 0; r < n; ++r) {
    for (std::size_t c = 0; c < columns.size(); ++c) row[c] = columns[c][r];
    t.append_row(t0 + dt * static_cast<double>(r), state, row);
  }
  return t;
}

inline TimeSeriesTable dhdl_table(const std::vector<double>& x, double dt = 1.0, double t0 = 0.0,
                                  const TableAttrs& a = attrs()) {
  return dhdl_table({x}, {"fep"}, LambdaState::scalar(0.0), dt, t0, a);
}

// Energy-difference table over scalar states `lambdas`. Rows sampled in state
// s hold u[k] = (lambda_k - lambda_s) * x_s[i] for every column k.
inline TimeSeriesTable u_nk_table(const std::vector<double>& lambdas,
                                  const std::vector<std::vector<double>>& x_per_state,
                                  double dt = 1.0, const TableAttrs& a = attrs()) {
  ColumnSchema schema;
  for (double l : lambdas) schema.ensure_state(LambdaState::scalar(l));
  TimeSeriesTable t(schema, a);
  std::vector<double> row(lambdas.size());
  for (std::size_t s = 0; s < x_per_state.size(); ++s) {
    const auto& x = x_per_state[s];
    for (std::size_t i = 0; i < x.size(); ++i) {
      for (std::size_t k = 0; k < lambdas.size(); ++k) row[k] = (lambdas[k] - lambdas[s]) * x[i];
      t.append_row(dt * static_cast<double>(i), LambdaState::scalar(lambdas[s]), row);
    }
  }
  return t;
}

// Rows stably reordered by time (states interleave).
inline TimeSeriesTable sorted_by_time(const TimeSeriesTable& t) {
  std::vector<std::size_t> rows(t.size());
  for (std::size_t i = 0; i < rows.size(); ++i) rows[i] = i;
  std::stable_sort(rows.begin(), rows.end(), [&](std::size_t a, std::size_t b) { return t.time(a) < t.time(b); });
  return t.take(rows);
}

inline std::vector<std::size_t> range(std::size_t begin, std::size_t end) {
  std::vector<std::size_t> out;
  for (std::size_t i = begin; i < end; ++i) out.push_back(i);
  return out;
}

inline std::vector<double> times_of(const TimeSeriesTable& t) {
  const auto ts = t.index().times();
  return std::vector<double>(ts.begin(), ts.end());
}

// Fresh directory under the system temp dir, removed on scope exit.
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::string& tag) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / ("decorr_" + tag + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write(const std::string& name, const std::string& text) const {
    const auto p = path_ / name;
    std::ofstream ofs(p);
    ofs << text;
    return p;
  }

private:
  std::filesystem::path path_;
};

} // namespace decorr::test
