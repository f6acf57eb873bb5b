#pragma once

#include <RandBLAS.hh>
#include <cstdint>
#include <vector>
#include <algorithm>

namespace LinCalc {

/// Rectangular matrix of reals stored in column-major order.
/// Entry (i, j) lives at A[i + n_rows * j], so A.data() can be passed
/// straight to BLAS and LAPACK with lda = n_rows.
template <typename T>
struct DenseMatrix {
    using scalar_t = T;
    int64_t n_rows;
    int64_t n_cols;
    std::vector<T> A;

    DenseMatrix() : n_rows(0), n_cols(0), A() {};

    DenseMatrix(int64_t m, int64_t n) :
    n_rows(m),
    n_cols(n),
    A(m * n, 0.0)
    {
        randblas_require(m >= 0);
        randblas_require(n >= 0);
    }

    /// Builds a matrix from a row-major list of rows.
    /// All rows must have the same length.
    DenseMatrix(const std::vector<std::vector<T>> &rows) :
    n_rows((int64_t) rows.size()),
    n_cols(rows.empty() ? 0 : (int64_t) rows[0].size()),
    A(n_rows * n_cols, 0.0)
    {
        for (int64_t i = 0; i < n_rows; ++i) {
            randblas_require((int64_t) rows[i].size() == n_cols);
            for (int64_t j = 0; j < n_cols; ++j)
                A[i + n_rows * j] = rows[i][j];
        }
    }

    inline T& operator()(int64_t i, int64_t j) { return A[i + n_rows * j]; }
    inline const T& operator()(int64_t i, int64_t j) const { return A[i + n_rows * j]; }

    T* data() { return A.data(); }
    const T* data() const { return A.data(); }

    int64_t size() const { return n_rows * n_cols; }
    bool empty() const { return n_rows == 0 || n_cols == 0; }
    bool is_square() const { return n_rows == n_cols; }

    bool same_shape(const DenseMatrix<T> &other) const {
        return n_rows == other.n_rows && n_cols == other.n_cols;
    }

    /// Reallocates to m-by-n and zeroes all entries.
    void reshape(int64_t m, int64_t n) {
        randblas_require(m >= 0);
        randblas_require(n >= 0);
        n_rows = m;
        n_cols = n;
        A.assign(m * n, 0.0);
    }
};

} // end namespace LinCalc
