#pragma once

#include <cmath>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

#include "decorr/alg/stats/StatisticalInefficiency.hpp"
#include "decorr/util/Parallel.hpp"

namespace decorr::alg::stats {

struct EquilibrationPoint {
  std::size_t t0 = 0;      // first sample considered equilibrated
  double g = 1.0;          // statistical inefficiency of [t0, N)
  std::size_t n_eff = 0;   // floor((N - t0) / g)
};

struct EquilibrationOptions {
  // Candidate start offsets are 0, nskip, 2*nskip, ...
  std::size_t nskip = 1;
  // Passed to the per-candidate inefficiency estimate.
  bool fast = true;
  std::size_t mintime = 3;
};

// Pick the start offset that maximizes the number of effectively independent
// samples. g_t[k] is the inefficiency of the subseries starting at k*nskip.
// Ties go to the later offset, i.e. the one discarding more burn-in.
inline EquilibrationPoint equilibration_point(std::span<const double> g_t, std::size_t n, std::size_t nskip = 1) {
  if (nskip == 0) throw std::runtime_error("equilibration_point: nskip must be > 0");
  EquilibrationPoint best{0, 1.0, n};
  bool have = false;
  for (std::size_t k = 0; k < g_t.size(); ++k) {
    const std::size_t t0 = k * nskip;
    if (t0 >= n) break;
    const double g = g_t[k];
    const auto n_eff = static_cast<std::size_t>(std::floor(static_cast<double>(n - t0) / g));
    if (!have || n_eff >= best.n_eff) {
      best = EquilibrationPoint{t0, g, n_eff};
      have = true;
    }
  }
  return best;
}

// Automatic equilibration detection over a scalar series.
//
// Each candidate offset needs its own O(N) inefficiency estimate, which makes
// this the hot path of the whole pipeline; candidates are independent and are
// evaluated in parallel. Inside an enclosing parallel region the loop runs on
// the calling thread unless nested parallelism is enabled. The selection fold
// itself is sequential.
inline EquilibrationPoint detect_equilibration(std::span<const double> a, const EquilibrationOptions& opt = {}) {
  if (opt.nskip == 0) throw std::runtime_error("detect_equilibration: nskip must be > 0");
  const std::size_t n = a.size();
  if (n < 2) return EquilibrationPoint{0, 1.0, n};

  double mu = 0.0;
  for (double x : a) mu += x;
  mu /= static_cast<double>(n);
  double var = 0.0;
  for (double x : a) var += (x - mu) * (x - mu);
  if (var == 0.0) return EquilibrationPoint{0, 1.0, n};

  // Candidates t0 <= n-2 so every subseries holds at least two samples.
  const std::size_t n_candidates = (n - 2) / opt.nskip + 1;
  std::vector<double> g_t(n_candidates, 1.0);

  InefficiencyOptions iopt;
  iopt.fast = opt.fast;
  iopt.mintime = opt.mintime;

  util::parallel_for(n_candidates, [&](std::size_t k) {
    const std::size_t t0 = k * opt.nskip;
    g_t[k] = statistical_inefficiency(a.subspan(t0), iopt);
  });

  return equilibration_point(g_t, n, opt.nskip);
}

} // namespace decorr::alg::stats
