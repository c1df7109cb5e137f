#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "decorr/core/TimeSeriesTable.hpp"

namespace decorr::io {

// A table as stored on disk plus the names of its state key columns.
struct TableFile {
  TimeSeriesTable table;
  std::vector<std::string> state_columns;
};

// Reader for the plain-text standardized table format produced by the
// engine-specific extraction tools:
//
//   # temperature = 300
//   # energy_unit = kT
//   # state_columns = coul-lambda,vdw-lambda
//   time coul-lambda vdw-lambda (0,0) (0.5,0) (1,0)
//   0.0  0 0  0.0 1.25 3.5
//
// - '# key = value' comments carry attrs; other comments are ignored.
// - The first non-comment line names the columns: "time", the state key
//   columns, then the value columns. A value column named like a state
//   ("0.5" or "(0.5,0)") holds energies evaluated at that state (u_nk);
//   any other name is a derivative column (dH/dl).
// - "nan" marks a missing value.
class TableReader {
public:
  explicit TableReader(std::filesystem::path path);

  TableFile read();

private:
  std::filesystem::path path_;
  std::ifstream ifs_;
  std::size_t lineno_ = 0;

  TableAttrs attrs_; // energy_unit defaults to kT
  bool have_temperature_ = false;
  std::vector<std::string> state_columns_;

  std::runtime_error error_(const std::string& msg) const;
  void parse_meta_(const std::string& line);
  ColumnSchema parse_header_(const std::string& line);
  LambdaState parse_state_key_(const std::vector<std::string_view>& toks) const;
};

inline TableFile read_table(const std::filesystem::path& path) {
  return TableReader(path).read();
}

} // namespace decorr::io
