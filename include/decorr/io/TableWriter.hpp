#pragma once

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "decorr/core/EnergyUnit.hpp"
#include "decorr/core/TimeSeriesTable.hpp"
#include "decorr/util/AtomicFile.hpp"

namespace decorr::io {

inline std::string format_value(double x) {
  if (std::isnan(x)) return "nan";
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.17g", x);
  return std::string(buf);
}

// Writes the format read by TableReader. When state_columns is empty, names
// are generated from the arity of the table's state keys.
inline void write_table(std::ostream& os, const TimeSeriesTable& table,
                        std::vector<std::string> state_columns = {}) {
  std::size_t arity = 0;
  for (const auto& s : table.index().states()) {
    const std::size_t k = s.is_labeled() ? 1 : s.lambdas.size();
    if (k > arity) arity = k;
  }
  if (state_columns.empty()) {
    for (std::size_t i = 0; i < arity; ++i) state_columns.push_back("lambda" + std::to_string(i));
  }
  if (state_columns.size() < arity) {
    throw std::runtime_error("write_table: " + std::to_string(state_columns.size()) +
                             " state column names for state keys of arity " + std::to_string(arity));
  }

  os << "# temperature = " << format_value(table.attrs().temperature) << "\n";
  os << "# energy_unit = " << energy_unit_name(table.attrs().energy_unit) << "\n";
  if (!state_columns.empty()) {
    os << "# state_columns = ";
    for (std::size_t i = 0; i < state_columns.size(); ++i) os << (i ? "," : "") << state_columns[i];
    os << "\n";
  }

  os << "time";
  for (const auto& n : state_columns) os << " " << n;
  for (std::size_t c = 0; c < table.n_columns(); ++c) os << " " << table.schema().info(c).name;
  os << "\n";

  for (std::size_t r = 0; r < table.size(); ++r) {
    os << format_value(table.time(r));
    const auto& s = table.state(r);
    if ((s.is_labeled() ? 1 : s.lambdas.size()) != arity) {
      throw std::runtime_error("write_table: state " + s.to_string() + " does not match the state key arity " +
                               std::to_string(arity));
    }
    if (s.is_labeled()) {
      os << " " << s.label;
    } else {
      for (double v : s.lambdas) os << " " << format_value(v);
    }
    for (std::size_t c = 0; c < table.n_columns(); ++c) os << " " << format_value(table.value(r, c));
    os << "\n";
  }
}

inline void write_table(const std::filesystem::path& path, const TimeSeriesTable& table,
                        const std::vector<std::string>& state_columns = {}) {
  util::atomic_write_text(path, [&](std::ostream& os) { write_table(os, table, state_columns); });
}

} // namespace decorr::io
