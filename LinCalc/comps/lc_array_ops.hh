#ifndef lincalc_comps_array_ops_h
#define lincalc_comps_array_ops_h

#include "lc_blaspp.hh"
#include "lc_lapackpp.hh"
#include "lc_macros.hh"
#include "lc_matrix.hh"
#include "lc_status.hh"
#include "lc_util.hh"

#include <RandBLAS.hh>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace LinCalc {

/// A square matrix whose reciprocal 1-norm condition number falls below
/// this value is treated as singular.
template <typename T>
T singular_rcond() {
    return 10 * std::numeric_limits<T>::epsilon();
}

/// Dense matrix arithmetic and LU-based operations.
/// Every method returns 0 on success or a Status code; outputs are only
/// written on success.
template <typename T>
class ArrayOps {
    public:
        virtual ~ArrayOps() {}

        virtual int add(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) = 0;

        virtual int subtract(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) = 0;

        virtual int multiply(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) = 0;

        virtual int lin_comb(
            T alpha,
            const DenseMatrix<T> &A,
            T beta,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) = 0;

        virtual int transpose(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &AT
        ) = 0;

        virtual int determinant(
            const DenseMatrix<T> &A,
            T &det
        ) = 0;

        virtual int inverse(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &A_inv
        ) = 0;

        virtual int condition(
            const DenseMatrix<T> &A,
            T &rcond
        ) = 0;

        virtual int upper_triangular(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &U,
            int64_t &swaps
        ) = 0;
};

template <typename T>
class LapackArrayOps : public ArrayOps<T> {
    public:

        LapackArrayOps(bool verb) {
            verbose = verb;
            rcond = 0.0;
            info = 0;
        }

        int add(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) override {
            return this->lin_comb((T) 1.0, A, (T) 1.0, B, C);
        }

        int subtract(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) override {
            return this->lin_comb((T) 1.0, A, (T) -1.0, B, C);
        }

        /// C := alpha * A + beta * B. A and B must have the same shape.
        int lin_comb(
            T alpha,
            const DenseMatrix<T> &A,
            T beta,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) override;

        /// C := A * B, computed with GEMM. Requires A.n_cols == B.n_rows.
        int multiply(
            const DenseMatrix<T> &A,
            const DenseMatrix<T> &B,
            DenseMatrix<T> &C
        ) override;

        int transpose(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &AT
        ) override;

        /// Determinant from the LU factorization computed by GETRF:
        /// the product of the diagonal of U, with one sign flip per row
        /// interchange recorded in ipiv.
        ///
        /// @return = 0: successful exit; a singular A yields det = 0.
        ///         = NotSquare: A is not square.
        int determinant(
            const DenseMatrix<T> &A,
            T &det
        ) override;

        /// Inverse by GETRF followed by GETRI.
        ///
        /// A is reported as singular when GETRF meets an exactly zero pivot, or
        /// when the reciprocal 1-norm condition number estimated by GECON is
        /// below 10 * machine epsilon. The estimate is kept in this->rcond.
        ///
        /// @return = 0: successful exit
        ///         = NotSquare: A is not square.
        ///         = Singular: A is (numerically) singular; A_inv is untouched.
        int inverse(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &A_inv
        ) override;

        /// Estimate of the reciprocal 1-norm condition number of A, from
        /// GETRF followed by GECON. rcond = 0 when GETRF meets an exactly zero
        /// pivot. The result does not depend on the scale of A, so it is the
        /// test for a (numerically) zero determinant.
        ///
        /// @return = 0: successful exit
        ///         = NotSquare: A is not square.
        int condition(
            const DenseMatrix<T> &A,
            T &rcond
        ) override;

        /// Upper trapezoidal factor U of the partially pivoted LU
        /// factorization PA = LU. U has the shape of A. The number of row
        /// interchanges performed is returned in swaps.
        int upper_triangular(
            const DenseMatrix<T> &A,
            DenseMatrix<T> &U,
            int64_t &swaps
        ) override;

    public:
        bool verbose;
        T rcond;
        int64_t info;

    private:
        int factor(const DenseMatrix<T> &A, DenseMatrix<T> &LU, std::vector<int64_t> &ipiv);
};

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::lin_comb(
    T alpha,
    const DenseMatrix<T> &A,
    T beta,
    const DenseMatrix<T> &B,
    DenseMatrix<T> &C
) {
    if (!A.same_shape(B)) {
        if (this->verbose)
            LINCALC_STATUS("shape mismatch: " << A.n_rows << "x" << A.n_cols << " vs " << B.n_rows << "x" << B.n_cols);
        return ShapeMismatch;
    }
    int64_t sz = A.size();
    DenseMatrix<T> R(A.n_rows, A.n_cols);
    blas::copy(sz, A.data(), 1, R.data(), 1);
    if (alpha != (T) 1.0)
        blas::scal(sz, alpha, R.data(), 1);
    blas::axpy(sz, beta, B.data(), 1, R.data(), 1);
    C = std::move(R);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::multiply(
    const DenseMatrix<T> &A,
    const DenseMatrix<T> &B,
    DenseMatrix<T> &C
) {
    if (A.n_cols != B.n_rows) {
        if (this->verbose)
            LINCALC_STATUS("inner dimensions differ: " << A.n_cols << " vs " << B.n_rows);
        return ShapeMismatch;
    }
    int64_t m = A.n_rows;
    int64_t n = B.n_cols;
    int64_t k = A.n_cols;
    randblas_require(m > 0 && k > 0);

    DenseMatrix<T> R(m, n);
    blas::gemm(Layout::ColMajor, Op::NoTrans, Op::NoTrans, m, n, k, (T) 1.0, A.data(), m, B.data(), k, (T) 0.0, R.data(), m);
    C = std::move(R);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::transpose(
    const DenseMatrix<T> &A,
    DenseMatrix<T> &AT
) {
    DenseMatrix<T> R(A.n_cols, A.n_rows);
    if (!A.empty())
        util::transposition(A.n_rows, A.n_cols, A.data(), A.n_rows, R.data(), A.n_cols);
    AT = std::move(R);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::determinant(
    const DenseMatrix<T> &A,
    T &det
) {
    if (!A.is_square() || A.empty())
        return NotSquare;

    int64_t n = A.n_rows;
    std::vector<T> LU(A.A);
    std::vector<int64_t> ipiv(n, 0);

    this->info = lapack::getrf(n, n, LU.data(), n, ipiv.data());
    if (this->verbose)
        LINCALC_STATUS("GETRF info = " << this->info);

    T d = 1.0;
    for (int64_t i = 0; i < n; ++i) {
        d *= LU[i + n * i];
        // ipiv is 1-based
        if (ipiv[i] != i + 1)
            d = -d;
    }
    det = d;
    return Ok;
}

// -----------------------------------------------------------------------------
// LU factorization of a square A with the condition estimate left in this->rcond.
template <typename T>
int LapackArrayOps<T>::factor(
    const DenseMatrix<T> &A,
    DenseMatrix<T> &LU,
    std::vector<int64_t> &ipiv
) {
    if (!A.is_square() || A.empty())
        return NotSquare;

    int64_t n = A.n_rows;
    LU = A;
    ipiv.assign(n, 0);

    T anorm = lapack::lange(Norm::One, n, n, A.data(), n);
    this->info = lapack::getrf(n, n, LU.data(), n, ipiv.data());
    if (this->info > 0) {
        if (this->verbose)
            LINCALC_STATUS("GETRF: U(" << this->info << "," << this->info << ") is exactly zero");
        this->rcond = 0.0;
        return Ok;
    }

    lapack::gecon(Norm::One, n, LU.data(), n, anorm, &this->rcond);
    if (this->verbose)
        LINCALC_STATUS("reciprocal condition number: " << this->rcond);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::condition(
    const DenseMatrix<T> &A,
    T &rcond
) {
    DenseMatrix<T> LU;
    std::vector<int64_t> ipiv;
    int err = this->factor(A, LU, ipiv);
    if (err)
        return err;
    rcond = this->rcond;
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::inverse(
    const DenseMatrix<T> &A,
    DenseMatrix<T> &A_inv
) {
    DenseMatrix<T> LU;
    std::vector<int64_t> ipiv;
    int err = this->factor(A, LU, ipiv);
    if (err)
        return err;
    if (this->rcond < singular_rcond<T>())
        return Singular;

    this->info = lapack::getri(A.n_rows, LU.data(), A.n_rows, ipiv.data());
    if (this->info > 0)
        return Singular;

    A_inv = std::move(LU);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int LapackArrayOps<T>::upper_triangular(
    const DenseMatrix<T> &A,
    DenseMatrix<T> &U,
    int64_t &swaps
) {
    int64_t m = A.n_rows;
    int64_t n = A.n_cols;
    randblas_require(m > 0 && n > 0);

    DenseMatrix<T> R(A);
    std::vector<int64_t> ipiv(std::min(m, n), 0);

    // info > 0 only flags a zero pivot; U is still well defined.
    this->info = lapack::getrf(m, n, R.data(), m, ipiv.data());
    if (this->verbose)
        LINCALC_STATUS("GETRF info = " << this->info);

    util::get_U(m, n, R.data(), m);

    int64_t s = 0;
    for (int64_t i = 0; i < (int64_t) ipiv.size(); ++i) {
        if (ipiv[i] != i + 1)
            ++s;
    }
    swaps = s;
    U = std::move(R);
    return Ok;
}

} // end namespace LinCalc
#endif
