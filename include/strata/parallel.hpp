#pragma once

#include <cstddef>

#ifdef STRATA_USE_OPENMP
#include <omp.h>
#endif

namespace strata {
namespace parallel {

// ============================================================================
// Thread Management
// ============================================================================

/// Get the maximum number of threads available for parallel regions
inline size_t get_num_threads() {
#ifdef STRATA_USE_OPENMP
    return static_cast<size_t>(omp_get_max_threads());
#else
    return 1;
#endif
}

/// Set the number of threads for parallel regions
inline void set_num_threads(size_t n) {
#ifdef STRATA_USE_OPENMP
    omp_set_num_threads(static_cast<int>(n));
#endif
    (void)n;
}

/// True when built with OpenMP and more than one thread is available
inline bool is_parallel_available() {
#ifdef STRATA_USE_OPENMP
    return omp_get_max_threads() > 1;
#else
    return false;
#endif
}

// ============================================================================
// RAII Thread Guard
// ============================================================================

/// RAII guard for temporarily changing the thread count
/// Restores the previous thread count when destroyed
class ThreadGuard {
#ifdef STRATA_USE_OPENMP
    int prev_threads_;

  public:
    explicit ThreadGuard(size_t n) : prev_threads_(omp_get_max_threads()) {
        omp_set_num_threads(static_cast<int>(n));
    }
    ~ThreadGuard() { omp_set_num_threads(prev_threads_); }
#else
  public:
    explicit ThreadGuard(size_t) {}
#endif
    ThreadGuard(const ThreadGuard &) = delete;
    ThreadGuard &operator=(const ThreadGuard &) = delete;
};

} // namespace parallel
} // namespace strata
