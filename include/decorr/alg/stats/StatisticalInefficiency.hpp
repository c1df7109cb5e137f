#pragma once

#include <cmath>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "decorr/core/Errors.hpp"

namespace decorr::alg::stats {

struct InefficiencyOptions {
  // Lags up to and including mintime are always accumulated, even when the
  // normalized autocovariance dips below zero.
  std::size_t mintime = 3;
  // Grow the lag increment by one after every accepted lag. Trades accuracy
  // for O(sqrt N) lag evaluations; used by the equilibration search.
  bool fast = false;
};

// Statistical inefficiency g of the pair (A, B): the number of correlated
// samples that carry the information of one independent sample.
//
//   g = 1 + 2 * sum_t C(t) * (1 - t/N)
//
// where C(t) is the symmetrized normalized cross-covariance at lag t. The sum
// stops at the first lag t > mintime with C(t) <= 0. Result is >= 1.0; a
// constant series (zero covariance) or N < 2 gives exactly 1.0.
inline double statistical_inefficiency(std::span<const double> a,
                                       std::span<const double> b,
                                       const InefficiencyOptions& opt = {}) {
  if (a.size() != b.size()) {
    throw ValidationError("statistical_inefficiency: series lengths differ (" + std::to_string(a.size()) +
                          " vs " + std::to_string(b.size()) + ")");
  }
  const std::size_t n = a.size();
  if (n < 2) return 1.0;

  double mu_a = 0.0;
  double mu_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mu_a += a[i];
    mu_b += b[i];
  }
  mu_a /= static_cast<double>(n);
  mu_b /= static_cast<double>(n);

  std::vector<double> da(n);
  std::vector<double> db(n);
  double sigma2_ab = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    da[i] = a[i] - mu_a;
    db[i] = b[i] - mu_b;
    sigma2_ab += da[i] * db[i];
  }
  sigma2_ab /= static_cast<double>(n);

  if (sigma2_ab == 0.0) return 1.0;

  double g = 1.0;
  std::size_t t = 1;
  std::size_t increment = 1;
  const double dn = static_cast<double>(n);
  while (t < n - 1) {
    double acc = 0.0;
    for (std::size_t i = 0; i + t < n; ++i) {
      acc += da[i] * db[i + t] + db[i] * da[i + t];
    }
    const double c = acc / (2.0 * static_cast<double>(n - t) * sigma2_ab);
    if (c <= 0.0 && t > opt.mintime) break;
    g += 2.0 * c * (1.0 - static_cast<double>(t) / dn) * static_cast<double>(increment);
    t += increment;
    if (opt.fast) ++increment;
  }

  return (g < 1.0) ? 1.0 : g;
}

inline double statistical_inefficiency(std::span<const double> a, const InefficiencyOptions& opt = {}) {
  return statistical_inefficiency(a, a, opt);
}

// Integer stride used by conservative subsampling.
inline std::size_t conservative_stride(double g) {
  if (!(g >= 1.0)) return 1;
  return static_cast<std::size_t>(std::ceil(g));
}

// Indices of approximately uncorrelated samples among n, given inefficiency g.
//
// conservative: every ceil(g)-th sample, so the subsample never claims more
//               independent samples than the data hold.
// otherwise:    round(k*g) for k = 0,1,..., ties to even, repeats skipped.
inline std::vector<std::size_t> subsample_indices(std::size_t n, double g, bool conservative) {
  std::vector<std::size_t> out;
  if (n == 0) return out;
  if (!std::isfinite(g) || g < 1.0) {
    throw ValidationError("subsample_indices: statistical inefficiency must be finite and >= 1");
  }

  if (conservative) {
    const std::size_t stride = conservative_stride(g);
    out.reserve(n / stride + 1);
    for (std::size_t i = 0; i < n; i += stride) out.push_back(i);
    return out;
  }

  out.reserve(static_cast<std::size_t>(static_cast<double>(n) / g) + 1);
  const double dn = static_cast<double>(n);
  for (std::size_t k = 0;; ++k) {
    const double t = std::nearbyint(static_cast<double>(k) * g);
    if (t >= dn) break;
    const std::size_t ti = static_cast<std::size_t>(t);
    if (out.empty() || out.back() != ti) out.push_back(ti);
  }
  return out;
}

} // namespace decorr::alg::stats
