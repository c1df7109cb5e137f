#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <vector>

#if defined(DECORR_HAS_OPENMP) && DECORR_HAS_OPENMP
  #include <omp.h>
#endif

namespace decorr::util {

// Run fn(i) for i in [0, n).
//
// Tasks must be independent and write only to their own slot of any shared
// output. Exceptions cannot cross an OpenMP region, so each task's exception is
// captured and the one with the lowest index is rethrown after the loop. The
// sequential build throws the same error directly.
template <class F>
inline void parallel_for(std::size_t n, F&& fn) {
#if defined(DECORR_HAS_OPENMP) && DECORR_HAS_OPENMP
  std::vector<std::exception_ptr> errors(n);
  #pragma omp parallel for schedule(dynamic)
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    const std::size_t i = static_cast<std::size_t>(ii);
    try {
      fn(i);
    } catch (...) {
      errors[i] = std::current_exception();
    }
  }
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
#else
  for (std::size_t i = 0; i < n; ++i) fn(i);
#endif
}

inline int max_threads() {
#if defined(DECORR_HAS_OPENMP) && DECORR_HAS_OPENMP
  return omp_get_max_threads();
#else
  return 1;
#endif
}

} // namespace decorr::util
