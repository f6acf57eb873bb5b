#ifndef lincalc_comps_reduce_h
#define lincalc_comps_reduce_h

#include "lc_format.hh"
#include "lc_macros.hh"
#include "lc_matrix.hh"
#include "lc_status.hh"
#include "lc_util.hh"

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <vector>

namespace LinCalc {

/// Row reduction: numerical rank and reduced row-echelon form.
template <typename T>
class Reducer {
    public:
        virtual ~Reducer() {}

        virtual int64_t rank(
            const DenseMatrix<T> &A
        ) = 0;

        virtual int rref(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &R,
            std::vector<int64_t> &pivots
        ) = 0;
};

template <typename T>
class EigenReducer : public Reducer<T> {
    public:
        using EMat = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        EigenReducer(T tol, bool verb) {
            zero_tol = tol;
            verbose = verb;
        }

        /// Numerical rank from a fully pivoted LU factorization. A pivot counts
        /// as nonzero when it exceeds zero_tol times the largest pivot.
        int64_t rank(
            const DenseMatrix<T> &A
        ) override;

        /// Computes the reduced row-echelon form of A through the CR factorization
        ///     A = C * R_top,
        /// where C collects the pivot columns of A and R_top holds the nonzero
        /// rows of rref(A).
        ///
        /// Pivot columns are chosen greedily from left to right: column j is a pivot
        /// when appending it to the pivots found so far raises the rank. R_top is then
        /// the unique solution of C * X = A, computed with a column-pivoted
        /// Householder QR of C.
        ///
        /// @param[in] A
        ///     The m-by-n input matrix.
        ///
        /// @param[out] R
        ///     m-by-n reduced row-echelon form. Rows beyond rank(A) are zero,
        ///     pivot columns are exact unit vectors and entries with magnitude
        ///     below zero_tol are set to zero.
        ///
        /// @param[out] pivots
        ///     0-based pivot column indices in increasing order.
        ///
        /// @return = 0: successful exit
        ///
        int rref(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &R,
            std::vector<int64_t> &pivots
        ) override;

    public:
        T zero_tol;
        bool verbose;
};

// -----------------------------------------------------------------------------
template <typename T>
int64_t EigenReducer<T>::rank(
    const DenseMatrix<T> &A
) {
    if (A.empty())
        return 0;
    Eigen::Map<const EMat> A_map(A.data(), A.n_rows, A.n_cols);
    Eigen::FullPivLU<EMat> lu(A_map);
    if (this->zero_tol > 0)
        lu.setThreshold(this->zero_tol);
    return (int64_t) lu.rank();
}

// -----------------------------------------------------------------------------
template <typename T>
int EigenReducer<T>::rref(
    const DenseMatrix<T> &A,
    DenseMatrix<T> &R,
    std::vector<int64_t> &pivots
) {
    int64_t m = A.n_rows;
    int64_t n = A.n_cols;

    std::vector<int64_t> piv;
    for (int64_t j = 0; j < n && (int64_t) piv.size() < m; ++j) {
        std::vector<int64_t> cand(piv);
        cand.push_back(j);
        if (this->rank(util::select_cols(A, cand)) > (int64_t) piv.size())
            piv.push_back(j);
    }
    int64_t r = (int64_t) piv.size();
    if (this->verbose)
        LINCALC_STATUS("rank " << r << ", pivot columns " << util::format_indices(piv));

    DenseMatrix<T> Rf(m, n);
    if (r > 0) {
        DenseMatrix<T> C = util::select_cols(A, piv);
        Eigen::Map<const EMat> C_map(C.data(), m, r);
        Eigen::Map<const EMat> A_map(A.data(), m, n);
        EMat X = C_map.colPivHouseholderQr().solve(A_map);

        for (int64_t j = 0; j < n; ++j)
            for (int64_t i = 0; i < r; ++i)
                Rf(i, j) = X(i, j);

        for (int64_t k = 0; k < r; ++k) {
            // the pivot column is the k-th unit vector, and nothing precedes the pivot in row k
            for (int64_t i = 0; i < r; ++i)
                Rf(i, piv[k]) = (i == k) ? 1.0 : 0.0;
            for (int64_t j = 0; j < piv[k]; ++j)
                Rf(k, j) = 0.0;
        }
        util::snap_zeros(Rf, this->zero_tol);
    }

    R = std::move(Rf);
    pivots = std::move(piv);
    return Ok;
}

} // end namespace LinCalc
#endif
