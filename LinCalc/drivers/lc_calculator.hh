#pragma once

#ifndef lincalc_drivers_calculator_h
#define lincalc_drivers_calculator_h

#include "lc_array_ops.hh"
#include "lc_config.hh"
#include "lc_format.hh"
#include "lc_macros.hh"
#include "lc_matrix.hh"
#include "lc_parse.hh"
#include "lc_reduce.hh"
#include "lc_status.hh"
#include "lc_util.hh"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace LinCalc {

enum class Operation {
    Add,
    Subtract,
    Multiply,
    LinearCombination,
    Transpose,
    Inverse,
    Determinant,
    RREF,
    UpperTriangular,
    Independence,
    Cramer
};

struct OperationInfo {
    Operation op;
    const char* name;
    const char* usage;
};

inline const std::vector<OperationInfo>& operation_table() {
    static const std::vector<OperationInfo> table = {
        {Operation::Add,               "add",       "add A B            A + B"},
        {Operation::Subtract,          "sub",       "sub A B            A - B"},
        {Operation::Multiply,          "mul",       "mul A B            A * B"},
        {Operation::LinearCombination, "lincomb",   "lincomb A B [C]    alpha*A + beta*B, alpha or beta may be det(C)"},
        {Operation::Transpose,         "transpose", "transpose A        A^T"},
        {Operation::Inverse,           "inverse",   "inverse A          A^-1"},
        {Operation::Determinant,       "det",       "det A              det(A)"},
        {Operation::RREF,              "rref",      "rref A             reduced row-echelon form and pivot columns"},
        {Operation::UpperTriangular,   "triu",      "triu A             upper triangular U of PA = LU"},
        {Operation::Independence,      "indep",     "indep V            linear independence of the rows of V"},
        {Operation::Cramer,            "cramer",    "cramer [A|b]       solve Ax = b by Cramer's rule"},
    };
    return table;
}

inline bool operation_from_name(const std::string &name, Operation &op) {
    for (const auto &entry : operation_table()) {
        if (name == entry.name) {
            op = entry.op;
            return true;
        }
    }
    return false;
}

inline std::string operation_name(Operation op) {
    for (const auto &entry : operation_table()) {
        if (entry.op == op)
            return entry.name;
    }
    return "unknown";
}

template <typename T>
struct OpRequest {
    Operation op;
    // raw operand text, in the order A, B, C
    std::vector<std::string> operands;
    T alpha;
    T beta;
    bool alpha_det;
    bool beta_det;

    OpRequest(Operation o, std::vector<std::string> ops) :
    op(o),
    operands(std::move(ops)),
    alpha(1.0),
    beta(1.0),
    alpha_det(false),
    beta_det(false)
    {}
};

template <typename T>
struct OpResult {
    int status;
    std::string title;
    // description on success, error text otherwise
    std::string message;
    bool has_matrix;
    DenseMatrix<T> matrix;
    bool has_scalar;
    T scalar;
    std::vector<int64_t> pivots;
    int64_t rank;

    OpResult() :
    status(Ok),
    title(),
    message(),
    has_matrix(false),
    matrix(),
    has_scalar(false),
    scalar(0.0),
    pivots(),
    rank(-1)
    {}

    std::string render(int decimals, bool multiline) const {
        std::string out = this->title + "\n";
        if (this->status != Ok) {
            out += "error (" + status_name(this->status) + "): " + this->message + "\n";
            return out;
        }
        if (!this->message.empty())
            out += this->message + "\n";
        if (this->has_matrix)
            out += util::format_matrix(this->matrix, decimals, multiline) + "\n";
        return out;
    }
};

template <typename T>
class Calculator {
    public:

        Calculator(
            // Requires the array and reduction collaborators and a parser.
            ArrayOps<T> &ops_obj,
            Reducer<T> &reducer_obj,
            MatrixParser<T> &parser_obj,
            const CalcConfig &config
        ) : Ops_Obj(ops_obj), Reducer_Obj(reducer_obj), Parser_Obj(parser_obj), cfg(config) {
            verbose = config.verbose;
        }

        /// Evaluates one request: parses every operand, checks operand counts and
        /// shapes, delegates the computation and fills res.
        ///
        /// Parse failures, non-conformable shapes, singular matrices and exceptions
        /// raised by the numerical libraries are all reported through res.status and
        /// res.message; nothing is thrown to the caller. No matrix is set in res
        /// unless the whole request succeeded.
        ///
        /// @return res.status; = 0 on success.
        int call(
            const OpRequest<T> &req,
            OpResult<T> &res
        );

    public:
        ArrayOps<T> &Ops_Obj;
        Reducer<T> &Reducer_Obj;
        MatrixParser<T> &Parser_Obj;
        CalcConfig cfg;
        bool verbose;

    private:
        int fail(OpResult<T> &res, int status, const std::string &msg);
        int expect_operands(const OpRequest<T> &req, size_t lo, size_t hi, OpResult<T> &res);
        int read_operand(const std::string &text, const std::string &name, Arity arity, DenseMatrix<T> &M, OpResult<T> &res);
        std::string num(T x) const;
        std::string shape(const DenseMatrix<T> &M) const;
        void set_matrix(OpResult<T> &res, DenseMatrix<T> &&M, T scale);
        int checked_det(const DenseMatrix<T> &A, T &det, bool &singular);

        int run_elementwise(const OpRequest<T> &req, OpResult<T> &res);
        int run_multiply(const OpRequest<T> &req, OpResult<T> &res);
        int run_lin_comb(const OpRequest<T> &req, OpResult<T> &res);
        int run_transpose(const OpRequest<T> &req, OpResult<T> &res);
        int run_inverse(const OpRequest<T> &req, OpResult<T> &res);
        int run_determinant(const OpRequest<T> &req, OpResult<T> &res);
        int run_rref(const OpRequest<T> &req, OpResult<T> &res);
        int run_upper_triangular(const OpRequest<T> &req, OpResult<T> &res);
        int run_independence(const OpRequest<T> &req, OpResult<T> &res);
        int run_cramer(const OpRequest<T> &req, OpResult<T> &res);
};

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::fail(
    OpResult<T> &res,
    int status,
    const std::string &msg
) {
    res.status = status;
    res.message = msg;
    res.has_matrix = false;
    res.matrix = DenseMatrix<T>();
    res.has_scalar = false;
    res.pivots.clear();
    res.rank = -1;
    if (this->verbose)
        LINCALC_STATUS(res.title << ": " << status_name(status) << ": " << msg);
    return status;
}

template <typename T>
int Calculator<T>::expect_operands(
    const OpRequest<T> &req,
    size_t lo,
    size_t hi,
    OpResult<T> &res
) {
    size_t k = req.operands.size();
    if (k >= lo && k <= hi)
        return Ok;
    std::string want = (lo == hi) ? std::to_string(lo) : std::to_string(lo) + " to " + std::to_string(hi);
    return this->fail(res, BadRequest, operation_name(req.op) + " expects " + want + " operand(s), got " + std::to_string(k));
}

template <typename T>
int Calculator<T>::read_operand(
    const std::string &text,
    const std::string &name,
    Arity arity,
    DenseMatrix<T> &M,
    OpResult<T> &res
) {
    int err = this->Parser_Obj.call(text, arity, M);
    if (err)
        return this->fail(res, err, name + ": " + this->Parser_Obj.error.message);
    return Ok;
}

template <typename T>
std::string Calculator<T>::num(T x) const {
    return util::format_number(x, std::max(6, this->cfg.precision));
}

template <typename T>
std::string Calculator<T>::shape(const DenseMatrix<T> &M) const {
    return std::to_string(M.n_rows) + "x" + std::to_string(M.n_cols);
}

template <typename T>
void Calculator<T>::set_matrix(OpResult<T> &res, DenseMatrix<T> &&M, T scale) {
    // roundoff is judged against the magnitude of the inputs, not in absolute terms
    util::snap_relative(M, (T) this->cfg.zero_tol, scale);
    if (this->verbose)
        util::print_colmaj(M.n_rows, M.n_cols, M.data(), M.n_rows, "result:");
    res.matrix = std::move(M);
    res.has_matrix = true;
}

/// det(A) together with a scale-free singularity test: A counts as singular
/// when its reciprocal condition number is below singular_rcond<T>(), and
/// det is then reported as exactly 0.
template <typename T>
int Calculator<T>::checked_det(
    const DenseMatrix<T> &A,
    T &det,
    bool &singular
) {
    int err = this->Ops_Obj.determinant(A, det);
    if (err)
        return err;
    T rcond = 0.0;
    err = this->Ops_Obj.condition(A, rcond);
    if (err)
        return err;
    singular = rcond < singular_rcond<T>();
    if (singular)
        det = 0.0;
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::call(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res = OpResult<T>();
    if (this->verbose)
        LINCALC_STATUS("operation " << operation_name(req.op) << " with " << req.operands.size() << " operand(s)");

    try {
        switch (req.op) {
            case Operation::Add:
            case Operation::Subtract:
                return this->run_elementwise(req, res);
            case Operation::Multiply:
                return this->run_multiply(req, res);
            case Operation::LinearCombination:
                return this->run_lin_comb(req, res);
            case Operation::Transpose:
                return this->run_transpose(req, res);
            case Operation::Inverse:
                return this->run_inverse(req, res);
            case Operation::Determinant:
                return this->run_determinant(req, res);
            case Operation::RREF:
                return this->run_rref(req, res);
            case Operation::UpperTriangular:
                return this->run_upper_triangular(req, res);
            case Operation::Independence:
                return this->run_independence(req, res);
            case Operation::Cramer:
                return this->run_cramer(req, res);
        }
    } catch (const std::exception &e) {
        if (this->verbose)
            LINCALC_ERROR(operation_name(req.op) << ": " << e.what());
        return this->fail(res, LibraryError, std::string("numerical library error: ") + e.what());
    }
    return this->fail(res, BadRequest, "unknown operation");
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_elementwise(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    bool is_sum = (req.op == Operation::Add);
    res.title = is_sum ? "Sum (A + B)" : "Difference (A - B)";
    if (this->expect_operands(req, 2, 2, res))
        return res.status;

    DenseMatrix<T> A, B, C;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res) ||
        this->read_operand(req.operands[1], "B", Arity::Matrix, B, res))
        return res.status;

    int err = is_sum ? this->Ops_Obj.add(A, B, C) : this->Ops_Obj.subtract(A, B, C);
    if (err == ShapeMismatch)
        return this->fail(res, err, "A and B must have the same shape (A: " + this->shape(A) + ", B: " + this->shape(B) + ")");
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = is_sum ? "A + B" : "A - B";
    this->set_matrix(res, std::move(C), std::max(util::max_abs(A), util::max_abs(B)));
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_multiply(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Product (A * B)";
    if (this->expect_operands(req, 2, 2, res))
        return res.status;

    DenseMatrix<T> A, B, C;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res) ||
        this->read_operand(req.operands[1], "B", Arity::Matrix, B, res))
        return res.status;

    int err = this->Ops_Obj.multiply(A, B, C);
    if (err == ShapeMismatch)
        return this->fail(res, err, "columns of A must equal rows of B (A: " + this->shape(A) + ", B: " + this->shape(B) + ")");
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = "A * B";
    this->set_matrix(res, std::move(C), util::max_abs(A) * util::max_abs(B));
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_lin_comb(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Linear combination (alpha*A + beta*B)";
    bool need_c = req.alpha_det || req.beta_det;
    if (this->expect_operands(req, need_c ? 3 : 2, need_c ? 3 : 2, res))
        return res.status;

    DenseMatrix<T> A, B, C;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res) ||
        this->read_operand(req.operands[1], "B", Arity::Matrix, B, res))
        return res.status;
    if (!A.same_shape(B))
        return this->fail(res, ShapeMismatch, "A and B must have the same shape (A: " + this->shape(A) + ", B: " + this->shape(B) + ")");

    T alpha = req.alpha;
    T beta = req.beta;
    std::string det_note;
    if (need_c) {
        DenseMatrix<T> Cm;
        if (this->read_operand(req.operands[2], "C", Arity::Matrix, Cm, res))
            return res.status;
        T det_c = 0.0;
        bool singular = false;
        int err = this->checked_det(Cm, det_c, singular);
        if (err == NotSquare)
            return this->fail(res, err, "det(C) needs a square matrix C (C: " + this->shape(Cm) + ")");
        if (err)
            return this->fail(res, err, status_name(err));
        if (req.alpha_det)
            alpha = det_c;
        if (req.beta_det)
            beta = det_c;
        det_note = "\ndet(C) = " + this->num(det_c);
    }

    int err = this->Ops_Obj.lin_comb(alpha, A, beta, B, C);
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = "alpha*A + beta*B (alpha = " + this->num(alpha) + ", beta = " + this->num(beta) + ")" + det_note;
    T scale = std::max(std::abs(alpha) * util::max_abs(A), std::abs(beta) * util::max_abs(B));
    this->set_matrix(res, std::move(C), scale);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_transpose(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Transpose";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> A, AT;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res))
        return res.status;

    int err = this->Ops_Obj.transpose(A, AT);
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = "A^T (" + this->shape(AT) + ")";
    this->set_matrix(res, std::move(AT), (T) 0.0);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_inverse(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Inverse";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> A, A_inv;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res))
        return res.status;

    int err = this->Ops_Obj.inverse(A, A_inv);
    if (err == NotSquare)
        return this->fail(res, err, "the matrix is not square (" + this->shape(A) + "), no inverse exists");
    if (err == Singular)
        return this->fail(res, err, "the matrix is not invertible: its determinant is zero");
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = "A^-1";
    this->set_matrix(res, std::move(A_inv), (T) 0.0);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_determinant(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Determinant";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> A;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res))
        return res.status;

    T det = 0.0;
    bool singular = false;
    int err = this->checked_det(A, det, singular);
    if (err == NotSquare)
        return this->fail(res, err, "the determinant is only defined for square matrices (A: " + this->shape(A) + ")");
    if (err)
        return this->fail(res, err, status_name(err));

    res.has_scalar = true;
    res.scalar = det;
    res.message = "det(A) = " + this->num(det);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_rref(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Reduced row-echelon form";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> A, R;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res))
        return res.status;

    std::vector<int64_t> pivots;
    int err = this->Reducer_Obj.rref(A, R, pivots);
    if (err)
        return this->fail(res, err, status_name(err));

    res.rank = (int64_t) pivots.size();
    res.message = "rank: " + std::to_string(res.rank) + "\npivot columns: " + util::format_indices(pivots);
    res.pivots = std::move(pivots);
    this->set_matrix(res, std::move(R), (T) 0.0);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_upper_triangular(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Upper triangular form (U)";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> A, U;
    if (this->read_operand(req.operands[0], "A", Arity::Matrix, A, res))
        return res.status;

    int64_t swaps = 0;
    int err = this->Ops_Obj.upper_triangular(A, U, swaps);
    if (err)
        return this->fail(res, err, status_name(err));

    res.message = "U from PA = LU, row interchanges: " + std::to_string(swaps);
    this->set_matrix(res, std::move(U), util::max_abs(A));
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_independence(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Linear independence of vectors";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    // one vector per column
    DenseMatrix<T> V, R;
    if (this->read_operand(req.operands[0], "vectors", Arity::VectorList, V, res))
        return res.status;

    std::vector<int64_t> pivots;
    int err = this->Reducer_Obj.rref(V, R, pivots);
    if (err)
        return this->fail(res, err, status_name(err));

    int64_t dim = V.n_rows;
    int64_t count = V.n_cols;
    res.rank = (int64_t) pivots.size();
    bool independent = (res.rank == count);
    res.message = "space dimension: " + std::to_string(dim)
        + "\nnumber of vectors: " + std::to_string(count)
        + "\nrank: " + std::to_string(res.rank)
        + "\nbasis vectors: " + util::format_indices(pivots)
        + "\nconclusion: " + (independent ? "INDEPENDENT" : "DEPENDENT");
    res.pivots = std::move(pivots);
    this->set_matrix(res, std::move(R), (T) 0.0);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int Calculator<T>::run_cramer(
    const OpRequest<T> &req,
    OpResult<T> &res
) {
    res.title = "Cramer's rule";
    if (this->expect_operands(req, 1, 1, res))
        return res.status;

    DenseMatrix<T> M;
    if (this->read_operand(req.operands[0], "[A|b]", Arity::Matrix, M, res))
        return res.status;

    int64_t n = M.n_rows;
    if (M.n_cols != n + 1)
        return this->fail(res, NotSquare, "the augmented matrix [A|b] must be n x (n+1), got " + this->shape(M));

    std::vector<int64_t> a_cols(n);
    for (int64_t j = 0; j < n; ++j)
        a_cols[j] = j;
    DenseMatrix<T> A = util::select_cols(M, a_cols);

    T det_a = 0.0;
    bool singular = false;
    int err = this->checked_det(A, det_a, singular);
    if (err)
        return this->fail(res, err, status_name(err));
    if (singular)
        return this->fail(res, Singular, "det(A) = 0: the system has no unique solution");

    DenseMatrix<T> x(n, 1);
    std::string detail = "det(A) = " + this->num(det_a);
    for (int64_t i = 0; i < n; ++i) {
        // A_i: A with column i replaced by b
        DenseMatrix<T> A_i(A);
        blas::copy(n, &M.A[n * n], 1, &A_i.A[n * i], 1);
        T det_i = 0.0;
        bool singular_i = false;
        err = this->checked_det(A_i, det_i, singular_i);
        if (err)
            return this->fail(res, err, status_name(err));
        x(i, 0) = det_i / det_a;
        std::string idx = std::to_string(i + 1);
        detail += "\nx" + idx + " = det(A_" + idx + ") / det(A) = " + this->num(det_i) + " / " + this->num(det_a)
            + " = " + this->num(x(i, 0));
    }

    res.message = detail;
    this->set_matrix(res, std::move(x), (T) 0.0);
    return Ok;
}

} // end namespace LinCalc
#endif
