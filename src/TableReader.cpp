#include "decorr/io/TableReader.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "decorr/util/Parse.hpp"

namespace decorr::io {

TableReader::TableReader(std::filesystem::path path)
    : path_(std::move(path)), ifs_(path_) {
  if (!ifs_) {
    throw std::runtime_error("TableReader: failed to open file: " + path_.string());
  }
  ifs_.exceptions(std::ios::badbit);
}

std::runtime_error TableReader::error_(const std::string& msg) const {
  return std::runtime_error("TableReader[" + path_.string() + ":" + std::to_string(lineno_) + "]: " + msg);
}

void TableReader::parse_meta_(const std::string& line) {
  const std::string_view body = trim(std::string_view(line).substr(1));
  const auto eq = body.find('=');
  if (eq == std::string_view::npos) return; // free-form comment

  const std::string key(trim(body.substr(0, eq)));
  const std::string val(trim(body.substr(eq + 1)));
  if (key == "temperature") {
    if (!parse_double(val, attrs_.temperature)) throw error_("invalid temperature: '" + val + "'");
    have_temperature_ = true;
  } else if (key == "energy_unit") {
    attrs_.energy_unit = parse_energy_unit(val);
  } else if (key == "state_columns") {
    state_columns_ = split_csv(val);
  }
}

ColumnSchema TableReader::parse_header_(const std::string& line) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  if (toks.empty() || toks[0] != "time") {
    throw error_("header must start with 'time', got: " + line);
  }
  if (toks.size() < 1 + state_columns_.size()) {
    throw error_("header lists fewer columns than state_columns declares");
  }
  for (std::size_t i = 0; i < state_columns_.size(); ++i) {
    if (toks[1 + i] != state_columns_[i]) {
      throw error_("expected state column '" + state_columns_[i] + "' at header position " +
                   std::to_string(2 + i) + ", got '" + std::string(toks[1 + i]) + "'");
    }
  }

  ColumnSchema schema;
  for (std::size_t i = 1 + state_columns_.size(); i < toks.size(); ++i) {
    const std::string name(toks[i]);
    if (schema.has(name)) throw error_("duplicate column name '" + name + "'");
    if (auto state = parse_lambda_state(name)) {
      schema.ensure_state(*state);
    } else {
      schema.ensure(name);
    }
  }
  return schema;
}

LambdaState TableReader::parse_state_key_(const std::vector<std::string_view>& toks) const {
  const std::size_t k = state_columns_.size();
  if (k == 0) return LambdaState();

  std::vector<double> lambdas;
  lambdas.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    double v = 0.0;
    if (!parse_double(toks[1 + i], v)) {
      // A single non-numeric key column is an opaque state label.
      if (k == 1) return LambdaState(std::string(toks[1]));
      throw error_("non-numeric state value '" + std::string(toks[1 + i]) + "' in column " + state_columns_[i]);
    }
    lambdas.push_back(v);
  }
  return LambdaState(std::move(lambdas));
}

TableFile TableReader::read() {
  std::string line;
  std::optional<ColumnSchema> schema;

  // Comments and blank lines up to the header.
  while (std::getline(ifs_, line)) {
    ++lineno_;
    const auto s = trim(line);
    if (s.empty()) continue;
    if (s.front() == '#') {
      parse_meta_(std::string(s));
      continue;
    }
    schema = parse_header_(std::string(s));
    break;
  }
  if (!schema) {
    throw std::runtime_error("TableReader: no header line in " + path_.string());
  }
  if (!have_temperature_) {
    throw std::runtime_error("TableReader: missing '# temperature = ...' in " + path_.string());
  }

  TableFile out;
  out.table = TimeSeriesTable(*schema, attrs_);
  out.state_columns = state_columns_;

  const std::size_t k = state_columns_.size();
  const std::size_t ncols = schema->size();
  std::vector<std::string_view> toks;
  std::vector<double> values(ncols);

  while (std::getline(ifs_, line)) {
    ++lineno_;
    const auto s = trim(line);
    if (s.empty() || s.front() == '#') continue;

    split_ws(s, toks);
    if (toks.size() != 1 + k + ncols) {
      throw error_("expected " + std::to_string(1 + k + ncols) + " fields, got " + std::to_string(toks.size()));
    }
    double t = 0.0;
    if (!parse_double(toks[0], t) || !std::isfinite(t)) {
      throw error_("invalid time value '" + std::string(toks[0]) + "'");
    }
    const LambdaState state = parse_state_key_(toks);
    for (std::size_t c = 0; c < ncols; ++c) {
      if (!parse_double(toks[1 + k + c], values[c])) {
        throw error_("invalid value '" + std::string(toks[1 + k + c]) + "' in column " + schema->info(c).name);
      }
    }
    out.table.append_row(t, state, values);
  }
  return out;
}

} // namespace decorr::io
