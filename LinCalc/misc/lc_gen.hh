#pragma once

#include "lc_matrix.hh"

#include <RandBLAS.hh>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace LinCalc::gen {

// Largest random matrix, in entries.
const int64_t MAX_RANDOM_ENTRIES = 16 * 1024 * 1024;
// Entry bounds; integers of this size are exact in double and their range width cannot overflow.
const int64_t MAX_RANDOM_MAGNITUDE = (int64_t) 1 << 52;

inline bool random_size_ok(int64_t m, int64_t n) {
    return m > 0 && n > 0 && m <= MAX_RANDOM_ENTRIES / n;
}

inline bool random_range_ok(int64_t low, int64_t high) {
    return low <= high && low >= -MAX_RANDOM_MAGNITUDE && high <= MAX_RANDOM_MAGNITUDE;
}

/// Fills A with an m-by-n matrix of integers drawn uniformly from
/// [low, high]. Entries are stored as reals so the result can be fed
/// straight back into any operation.
///
/// @param[in] state
///     RandBLAS RNG state. The state that follows the draw is returned so
///     that consecutive calls produce independent matrices.
///
template <typename T, typename RNG>
RandBLAS::RNGState<RNG> random_int_matrix(
    int64_t m,
    int64_t n,
    int64_t low,
    int64_t high,
    DenseMatrix<T> &A,
    const RandBLAS::RNGState<RNG> &state
) {
    randblas_require(random_size_ok(m, n));
    randblas_require(random_range_ok(low, high));

    A.reshape(m, n);
    RandBLAS::DenseDist D(m, n, RandBLAS::ScalarDist::Uniform);
    auto next_state = RandBLAS::fill_dense(D, A.data(), state);

    // Uniform entries on [-1, 1] are mapped onto the integer range.
    T width = (T) (high - low + 1);
    for (auto &entry : A.A) {
        T t = (entry + (T) 1.0) / (T) 2.0;
        T val = (T) low + std::floor(t * width);
        entry = std::clamp(val, (T) low, (T) high);
    }
    return next_state;
}

} // end namespace LinCalc::gen
