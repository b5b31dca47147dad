#pragma once

#include <cstddef>
#include <cstdint>

#if defined(MATDIM_HAS_OPENMP) && MATDIM_HAS_OPENMP
  #include <omp.h>
#endif

namespace matdim::util {

// Index loop distributed over OpenMP threads when available.
//
// `n_threads <= 0` uses the OpenMP default. The thread count is passed per
// loop (num_threads clause), never set process-wide. `fn` must not throw;
// results must be written to per-index slots so the outcome does not depend
// on scheduling.
template <class F>
inline void parallel_for(std::size_t n, int n_threads, F&& fn) {
#if defined(MATDIM_HAS_OPENMP) && MATDIM_HAS_OPENMP
  const int nt = (n_threads > 0) ? n_threads : omp_get_max_threads();
  #pragma omp parallel for schedule(dynamic) num_threads(nt)
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    fn(static_cast<std::size_t>(ii));
  }
#else
  (void)n_threads;
  for (std::size_t i = 0; i < n; ++i) {
    fn(i);
  }
#endif
}

} // namespace matdim::util
