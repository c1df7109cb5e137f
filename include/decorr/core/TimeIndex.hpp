#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "decorr/core/LambdaState.hpp"

namespace decorr {

// Composite row key (time, state) shared by tables and series.
//
// States are interned in first-appearance order; that order is the state
// enumeration order every transform preserves when it recombines partitions.
class TimeIndex {
public:
  std::size_t size() const { return time_.size(); }
  bool empty() const { return time_.empty(); }

  double time(std::size_t row) const { return time_[row]; }
  std::size_t state_id(std::size_t row) const { return state_id_[row]; }
  const LambdaState& state(std::size_t row) const { return states_[state_id_[row]]; }

  std::span<const double> times() const { return {time_.data(), time_.size()}; }
  const std::vector<LambdaState>& states() const { return states_; }

  std::optional<std::size_t> find_state(const LambdaState& s) const {
    for (std::size_t i = 0; i < states_.size(); ++i) {
      if (states_[i] == s) return i;
    }
    return std::nullopt;
  }

  std::size_t ensure_state(const LambdaState& s) {
    if (auto id = find_state(s)) return *id;
    states_.push_back(s);
    return states_.size() - 1;
  }

  void push_back(double t, std::size_t sid) {
    if (sid >= states_.size()) throw std::runtime_error("TimeIndex: state id out of range");
    time_.push_back(t);
    state_id_.push_back(static_cast<std::uint32_t>(sid));
  }

  void reserve(std::size_t n) {
    time_.reserve(n);
    state_id_.reserve(n);
  }

  // Same state dictionary, selected rows in the given order.
  TimeIndex take(std::span<const std::size_t> rows) const {
    TimeIndex out;
    out.states_ = states_;
    out.reserve(rows.size());
    for (std::size_t r : rows) {
      if (r >= size()) throw std::runtime_error("TimeIndex: row out of range");
      out.time_.push_back(time_[r]);
      out.state_id_.push_back(state_id_[r]);
    }
    return out;
  }

  // Rows of each state in storage order, states in enumeration order.
  // States without rows are skipped.
  struct Partition {
    std::size_t state_id = 0;
    std::vector<std::size_t> rows;
  };

  std::vector<Partition> partitions() const {
    std::vector<std::vector<std::size_t>> by_state(states_.size());
    for (std::size_t r = 0; r < time_.size(); ++r) by_state[state_id_[r]].push_back(r);
    std::vector<Partition> out;
    for (std::size_t s = 0; s < by_state.size(); ++s) {
      if (by_state[s].empty()) continue;
      out.push_back(Partition{s, std::move(by_state[s])});
    }
    return out;
  }

private:
  std::vector<double> time_;
  std::vector<std::uint32_t> state_id_;
  std::vector<LambdaState> states_;
};

} // namespace decorr
