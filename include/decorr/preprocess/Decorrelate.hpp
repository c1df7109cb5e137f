#pragma once

#include <string>

#include "decorr/core/Series.hpp"
#include "decorr/core/TimeSeriesTable.hpp"
#include "decorr/preprocess/Window.hpp"

namespace decorr::preprocess {

// How the per-state reference series is built from an energy-difference table.
enum class UNkMethod {
  DHdl,    // u[adjacent state] - u[own state]
  DHdlAll, // sum over all state columns of u[k] - u[own state]
  DE,      // sum over all other state columns of |u[k] - u[own state]|
};

std::string unk_method_name(UNkMethod m);
UNkMethod parse_unk_method(std::string s);

struct DecorrelateOptions : Window {
  bool conservative = false;
  bool drop_duplicates = true;
  bool sort = false;
  // Search for and discard burn-in (equilibrium_detection). When off, only
  // subsample (statistical_inefficiency).
  bool remove_burnin = true;
};

// Reference series of an energy-difference table, one value per row, each row
// measured against the column of its own state.
//
// Throws DomainMismatchError if a state has no column of its own (e.g. a
// derivative table), or if the method needs a neighbor and the table has
// fewer than two state columns.
Series u_nk_reference_series(const TimeSeriesTable& u_nk, UNkMethod method);

// Reference series of a derivative table: the row sum across its columns.
Series dhdl_reference_series(const TimeSeriesTable& dhdl);

TimeSeriesTable decorrelate_u_nk(const TimeSeriesTable& u_nk, UNkMethod method = UNkMethod::DHdl,
                                 const DecorrelateOptions& opt = {});

TimeSeriesTable decorrelate_dhdl(const TimeSeriesTable& dhdl, const DecorrelateOptions& opt = {});

} // namespace decorr::preprocess
