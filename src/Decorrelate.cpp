#include "decorr/preprocess/Decorrelate.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <vector>

#include "decorr/core/Errors.hpp"
#include "decorr/preprocess/Subsampling.hpp"

namespace decorr::preprocess {

std::string unk_method_name(UNkMethod m) {
  switch (m) {
    case UNkMethod::DHdl: return "dhdl";
    case UNkMethod::DHdlAll: return "dhdl_all";
    case UNkMethod::DE: return "dE";
  }
  return "dhdl";
}

UNkMethod parse_unk_method(std::string s) {
  if (s == "dE") return UNkMethod::DE;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(::tolower(c)); });
  if (s == "dhdl") return UNkMethod::DHdl;
  if (s == "dhdl_all") return UNkMethod::DHdlAll;
  if (s == "de") return UNkMethod::DE;
  throw ValidationError("decorrelate_u_nk: decorrelation method '" + s + "' not found (use dhdl|dhdl_all|dE)");
}

Series u_nk_reference_series(const TimeSeriesTable& u_nk, UNkMethod method) {
  const std::string who = "decorrelate_u_nk(" + unk_method_name(method) + ")";
  const auto& schema = u_nk.schema();
  const auto& states = u_nk.index().states();
  const auto state_cols = schema.state_columns();

  if (state_cols.empty()) {
    throw DomainMismatchError(who + ": table has no energy-difference columns; is it a u_nk table?");
  }
  if (method != UNkMethod::DHdlAll && state_cols.size() < 2) {
    throw DomainMismatchError(who + ": method needs at least two state columns, table has " +
                              std::to_string(state_cols.size()));
  }

  // Per state: own column and, for dhdl, the adjacent one (next, or previous
  // for the last state).
  std::vector<std::optional<std::size_t>> own(states.size());
  std::vector<std::size_t> adjacent(states.size(), 0);
  for (const auto& part : u_nk.index().partitions()) {
    const auto& s = states[part.state_id];
    const auto col = schema.find_state(s);
    if (!col) {
      throw DomainMismatchError(who + ": no energy column for sampled state " + detail::describe_state(s) +
                                "; is it a u_nk table?");
    }
    own[part.state_id] = col;
    if (state_cols.size() < 2) continue;
    const auto it = std::find(state_cols.begin(), state_cols.end(), *col);
    const auto pos = static_cast<std::size_t>(it - state_cols.begin());
    adjacent[part.state_id] = (pos + 1 < state_cols.size()) ? state_cols[pos + 1] : state_cols[pos - 1];
  }

  std::vector<double> values(u_nk.size(), 0.0);
  for (std::size_t r = 0; r < u_nk.size(); ++r) {
    const std::size_t sid = u_nk.index().state_id(r);
    const double self = u_nk.value(r, *own[sid]);
    double v = 0.0;
    switch (method) {
      case UNkMethod::DHdl:
        v = u_nk.value(r, adjacent[sid]) - self;
        break;
      case UNkMethod::DHdlAll:
        for (std::size_t c : state_cols) v += u_nk.value(r, c) - self;
        break;
      case UNkMethod::DE:
        for (std::size_t c : state_cols) {
          if (c != *own[sid]) v += std::fabs(u_nk.value(r, c) - self);
        }
        break;
    }
    values[r] = v;
  }
  return Series(unk_method_name(method), u_nk.index(), std::move(values));
}

Series dhdl_reference_series(const TimeSeriesTable& dhdl) {
  if (dhdl.n_columns() == 0) {
    throw DomainMismatchError("decorrelate_dhdl: table has no value columns");
  }
  if (dhdl.n_columns() == 1) return dhdl.column_series(0);
  return dhdl.row_sum();
}

namespace {

TimeSeriesTable decorrelate(const TimeSeriesTable& table, const Series& reference, const DecorrelateOptions& opt) {
  SubsampleOptions sopt;
  sopt.lower = opt.lower;
  sopt.upper = opt.upper;
  sopt.step = opt.step;
  sopt.conservative = opt.conservative;
  sopt.drop_duplicates = opt.drop_duplicates;
  sopt.sort = opt.sort;
  if (opt.remove_burnin) return equilibrium_detection(table, reference, sopt);
  return statistical_inefficiency(table, reference, sopt);
}

} // namespace

TimeSeriesTable decorrelate_u_nk(const TimeSeriesTable& u_nk, UNkMethod method, const DecorrelateOptions& opt) {
  return decorrelate(u_nk, u_nk_reference_series(u_nk, method), opt);
}

TimeSeriesTable decorrelate_dhdl(const TimeSeriesTable& dhdl, const DecorrelateOptions& opt) {
  return decorrelate(dhdl, dhdl_reference_series(dhdl), opt);
}

} // namespace decorr::preprocess
