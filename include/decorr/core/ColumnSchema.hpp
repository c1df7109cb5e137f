#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "decorr/core/LambdaState.hpp"

namespace decorr {

// Ordered value-column descriptors of a TimeSeriesTable.
//
// Energy-difference (u_nk) columns carry the state they were evaluated at;
// derivative (dH/dl) columns are plain names such as "fep" or "coul".
// Names are resolved to integer ids once so the per-row loops index by id.
class ColumnSchema {
public:
  struct ColumnInfo {
    std::string name;
    std::optional<LambdaState> state;

    bool operator==(const ColumnInfo& o) const { return name == o.name && state == o.state; }
  };

  // Return existing column id, or append a new derivative-style column.
  std::size_t ensure(const std::string& name) {
    auto it = name2id_.find(name);
    if (it != name2id_.end()) {
      if (columns_[it->second].state) {
        throw std::runtime_error("ColumnSchema: column '" + name + "' already registered as a state column");
      }
      return it->second;
    }
    return append_(ColumnInfo{name, std::nullopt});
  }

  // Return existing column id, or append a new energy-difference column for `state`.
  std::size_t ensure_state(const LambdaState& state) {
    const std::string name = state.to_string();
    auto it = name2id_.find(name);
    if (it != name2id_.end()) {
      if (!columns_[it->second].state || *columns_[it->second].state != state) {
        throw std::runtime_error("ColumnSchema: column '" + name + "' registered with a different state");
      }
      return it->second;
    }
    return append_(ColumnInfo{name, state});
  }

  std::size_t require(const std::string& name) const {
    auto it = name2id_.find(name);
    if (it == name2id_.end()) {
      throw std::runtime_error("ColumnSchema: required column '" + name + "' not found");
    }
    return it->second;
  }

  bool has(const std::string& name) const {
    return name2id_.find(name) != name2id_.end();
  }

  // Column holding energies evaluated at `state`, if any.
  std::optional<std::size_t> find_state(const LambdaState& state) const {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i].state && *columns_[i].state == state) return i;
    }
    return std::nullopt;
  }

  // Ids of all energy-difference columns, in column order.
  std::vector<std::size_t> state_columns() const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i].state) out.push_back(i);
    }
    return out;
  }

  const ColumnInfo& info(std::size_t id) const {
    if (id >= columns_.size()) throw std::runtime_error("ColumnSchema: invalid column id");
    return columns_[id];
  }

  std::size_t size() const { return columns_.size(); }

  bool operator==(const ColumnSchema& o) const { return columns_ == o.columns_; }
  bool operator!=(const ColumnSchema& o) const { return !(*this == o); }

private:
  std::vector<ColumnInfo> columns_;
  std::unordered_map<std::string, std::size_t> name2id_;

  std::size_t append_(ColumnInfo ci) {
    const std::size_t id = columns_.size();
    columns_.push_back(std::move(ci));
    name2id_.emplace(columns_.back().name, id);
    return id;
  }
};

} // namespace decorr
