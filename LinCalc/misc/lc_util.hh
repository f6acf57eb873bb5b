#pragma once

#include "lc_blaspp.hh"
#include "lc_lapackpp.hh"
#include "lc_matrix.hh"

#include <RandBLAS.hh>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <vector>

namespace LinCalc::util {

template <typename T>
void print_colmaj(int64_t n_rows, int64_t n_cols, const T *a, int64_t lda, const char label[])
{
    std::cout << "\n" << label << std::endl;
    for (int64_t i = 0; i < n_rows; ++i) {
        std::cout << "\t";
        for (int64_t j = 0; j < n_cols; ++j) {
            T val = a[i + lda * j];
            if (val < 0) {
                printf("  %2.6f,", (double) val);
            } else {
                printf("   %2.6f,", (double) val);
            }
        }
        printf("\n");
    }
    printf("\n");
    return;
}

/// Generates an identity matrix. Assuming col-maj
template <typename T>
void eye(
    int64_t m,
    int64_t n,
    T* A
) {
    int64_t min = std::min(m, n);
    for (int64_t i = 0; i < m*n; ++i)
        A[i] = 0.0;
    for (int64_t j = 0; j < min; ++j)
        A[(m * j) + j] = 1.0;
}

template <typename T>
DenseMatrix<T> eye(
    int64_t n
) {
    DenseMatrix<T> I(n, n);
    eye(n, n, I.data());
    return I;
}

/// Zeros-out the strictly lower-triangular portion of the m-by-n matrix A.
/// Works for any m and n; the result is upper trapezoidal.
template <typename T>
void get_U(
    int64_t m,
    int64_t n,
    T* A,
    int64_t lda
) {
    for (int64_t j = 0; j < n; ++j) {
        if (j + 1 < m)
            std::fill(&A[j * lda + j + 1], &A[j * lda + m], 0.0);
    }
}

// Perform an explicit transposition of a given matrix,
// write the transpose into a buffer.
template <typename T>
void transposition(
    int64_t m,
    int64_t n,
    const T* A,
    int64_t lda,
    T* AT,
    int64_t ldat
) {
    randblas_require(lda >= m);
    randblas_require(ldat >= n);
    for (int64_t i = 0; i < n; ++i)
        blas::copy(m, &A[i * lda], 1, &AT[i], ldat);
}

/// Copies column indices `cols` of A into a new matrix, in the given order.
template <typename T>
DenseMatrix<T> select_cols(
    const DenseMatrix<T> &A,
    const std::vector<int64_t> &cols
) {
    DenseMatrix<T> C(A.n_rows, (int64_t) cols.size());
    for (size_t k = 0; k < cols.size(); ++k) {
        randblas_require(cols[k] >= 0 && cols[k] < A.n_cols);
        blas::copy(A.n_rows, &A.A[cols[k] * A.n_rows], 1, &C.A[k * A.n_rows], 1);
    }
    return C;
}

/// Sets every entry with |a_ij| <= tol to exactly zero.
template <typename T>
void snap_zeros(
    DenseMatrix<T> &A,
    T tol
) {
    for (auto &entry : A.A) {
        if (std::abs(entry) <= tol)
            entry = 0.0;
    }
}

/// Largest entry of A in magnitude; 0 for an empty matrix.
template <typename T>
T max_abs(
    const DenseMatrix<T> &A
) {
    if (A.empty())
        return 0.0;
    // blas::iamax is 0-based
    int64_t k = blas::iamax(A.size(), A.data(), 1);
    return std::abs(A.A[k]);
}

/// Sets every entry that is negligible next to `scale` to exactly zero:
/// |a_ij| <= tol * max(scale, max|a_ij|).
template <typename T>
void snap_relative(
    DenseMatrix<T> &A,
    T tol,
    T scale
) {
    T ref = std::max(scale, max_abs(A));
    snap_zeros(A, tol * ref);
}

} // end namespace LinCalc::util
