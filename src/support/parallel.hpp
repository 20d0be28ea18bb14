// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Loop-level parallelization macros over OpenMP with a sequential fallback
 *
 * Batch kernels evaluate one option per loop iteration and never read
 * another element's result, so every element loop may be vectorized and,
 * for large batches, split across threads.
 *
 * Usage:
 *   VANILLA_PRAGMA_SIMD
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   VANILLA_PRAGMA_PARALLEL_FOR_SIMD
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #define VANILLA_PRAGMA_SIMD                  _Pragma("omp simd")
    #define VANILLA_PRAGMA_PARALLEL_FOR_SIMD     _Pragma("omp parallel for simd schedule(static)")
#else
    #define VANILLA_PRAGMA_SIMD
    #define VANILLA_PRAGMA_PARALLEL_FOR_SIMD
#endif

#include <cstddef>

namespace vanilla {

/// Evaluate out[i] = fn(i) for every element of a batch
///
/// Batches of at least @p parallel_threshold elements are split across
/// threads; smaller ones run as a single vectorized loop. A threshold of
/// zero keeps every batch on the calling thread.
template <typename Fn>
void for_each_element(double* out, size_t n, size_t parallel_threshold, Fn&& fn) {
    if (parallel_threshold != 0 && n >= parallel_threshold) {
        VANILLA_PRAGMA_PARALLEL_FOR_SIMD
        for (size_t i = 0; i < n; ++i) {
            out[i] = fn(i);
        }
        return;
    }

    VANILLA_PRAGMA_SIMD
    for (size_t i = 0; i < n; ++i) {
        out[i] = fn(i);
    }
}

}  // namespace vanilla
