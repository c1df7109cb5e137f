#pragma once

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace decorr {

// Key of a thermodynamic (lambda) state.
//
// Most engines label states by a tuple of coupling parameters, e.g.
// (coul-lambda, vdw-lambda). Some only give an opaque name; in that case the
// tuple is empty and `label` carries the name. Equality is exact on both.
struct LambdaState {
  std::vector<double> lambdas;
  std::string label;

  LambdaState() = default;
  explicit LambdaState(std::vector<double> values) : lambdas(std::move(values)) {}
  explicit LambdaState(std::string name) : label(std::move(name)) {}

  static LambdaState scalar(double value) { return LambdaState(std::vector<double>{value}); }

  bool is_labeled() const { return lambdas.empty() && !label.empty(); }
  bool empty() const { return lambdas.empty() && label.empty(); }

  bool operator==(const LambdaState& o) const { return lambdas == o.lambdas && label == o.label; }
  bool operator!=(const LambdaState& o) const { return !(*this == o); }

  // Canonical text: "0.25" for a single value, "(0,0.25)" for a tuple,
  // the label otherwise. Used for diagnostics and energy-difference column names.
  std::string to_string() const {
    if (lambdas.empty()) return label;
    if (lambdas.size() == 1) return format_(lambdas[0]);
    std::string out = "(";
    for (std::size_t i = 0; i < lambdas.size(); ++i) {
      if (i) out += ",";
      out += format_(lambdas[i]);
    }
    out += ")";
    return out;
  }

private:
  static std::string format_(double x) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", x);
    return std::string(buf);
  }
};

} // namespace decorr
