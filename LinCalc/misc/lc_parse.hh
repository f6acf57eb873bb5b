#pragma once

#include "lc_matrix.hh"
#include "lc_status.hh"
#include "lc_macros.hh"

#include <cstdint>
#include <cstdlib>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace LinCalc {

/// What the text is supposed to describe. Vector lists are typed one
/// vector per row and come back with one vector per column.
enum class Arity {
    Matrix,
    VectorList
};

/// Detail of the most recent parse failure.
/// Row and column numbers are 1-based; zero means "not applicable".
struct ParseError {
    int kind;
    int64_t row;
    int64_t col;
    std::string token;
    int64_t expected;
    int64_t actual;
    std::string message;

    ParseError() : kind(Ok), row(0), col(0), token(), expected(0), actual(0), message() {};
};

namespace parse {

inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline std::string trim(const std::string &s) {
    size_t lo = 0;
    size_t hi = s.size();
    while (lo < hi && is_blank(s[lo]))
        ++lo;
    while (hi > lo && is_blank(s[hi - 1]))
        --hi;
    return s.substr(lo, hi - lo);
}

/// Splits one row on runs of commas and/or whitespace; empty tokens are dropped.
inline std::vector<std::string> tokenize_row(const std::string &row) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : row) {
        if (c == ',' || is_blank(c)) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        tokens.push_back(cur);
    return tokens;
}

/// Splits text into rows at line breaks and at every ';'.
/// Rows that are blank after trimming are dropped.
inline std::vector<std::string> split_rows(const std::string &text) {
    std::vector<std::string> rows;
    std::string cur;
    for (char c : text) {
        if (c == '\n' || c == ';') {
            std::string r = trim(cur);
            if (!r.empty())
                rows.push_back(r);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string r = trim(cur);
    if (!r.empty())
        rows.push_back(r);
    return rows;
}

/// Converts the whole token to a finite real. Partial matches such as
/// "1.5x", hexadecimal literals ("0x10", "0x1p3"), the special values
/// nan and inf, and values outside the range of T are rejected.
template <typename T>
bool to_real(const std::string &token, T &val) {
    if (token.empty())
        return false;
    if (token.find_first_of("xX") != std::string::npos)
        return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin || *end != '\0')
        return false;
    if (!std::isfinite(d) || std::abs(d) > (double) std::numeric_limits<T>::max())
        return false;
    val = (T) d;
    return true;
}

/// True for rows typed as bracketed lists without the enclosing brackets,
/// e.g. "[1, 2], [3, 4]". pos sits on the first '['.
inline bool bare_row_list(const std::string &s, size_t pos) {
    size_t next = s.find_first_not_of(" \t\r\n\v\f", pos + 1);
    if (next == std::string::npos || s[next] == '[')
        return false;
    size_t close = s.find_first_of("[]", next);
    if (close == std::string::npos || s[close] == '[')
        return false;
    size_t after = s.find_first_not_of(" \t\r\n\v\f", close + 1);
    return after != std::string::npos && (s[after] == ',' || s[after] == ';' || s[after] == '[');
}

/// A short excerpt of text starting at pos, used to name offending input.
inline std::string excerpt(const std::string &s, size_t pos) {
    size_t end = pos;
    while (end < s.size() && !is_blank(s[end]) && end - pos < 16)
        ++end;
    return s.substr(pos, end - pos);
}

} // end namespace parse

template <typename T>
class MatrixParser {
    public:

        MatrixParser(bool verb) {
            verbose = verb;
            cur_arity = Arity::Matrix;
        }

        /// Converts free-form text into a rectangular matrix.
        ///
        /// Three notations are accepted, tried in this order:
        ///     (1) bracketed lists, "[[1,2,3],[4,5,6]]", recognized by a leading '[';
        ///         the outer brackets may be left out, "[1,2,3],[4,5,6]";
        ///         a flat "[1 2; 3 4]" is read as semicolon-row notation in brackets;
        ///     (2) semicolon rows, "1 2; 3 4";
        ///     (3) newline rows, "1,2,3\n4,5,6".
        /// ';' and line breaks are interchangeable row separators. Cells are
        /// separated by commas and/or whitespace.
        ///
        /// @param[in] text
        ///     Raw user input.
        ///
        /// @param[in] arity
        ///     Arity::Matrix returns rows as typed. Arity::VectorList treats every
        ///     row as one vector and returns the vectors as columns.
        ///
        /// @param[out] M
        ///     On success, the parsed matrix. Untouched on failure.
        ///
        /// @return = 0: successful exit
        ///         = EmptyInput, MalformedToken or RaggedRows otherwise;
        ///           the details are stored in this->error.
        ///
        int call(
            const std::string &text,
            Arity arity,
            DenseMatrix<T> &M
        );

    public:
        bool verbose;
        ParseError error;

    private:
        Arity cur_arity;

        const char* row_word() const {
            return cur_arity == Arity::VectorList ? "vector" : "row";
        }

        int fail(int kind, int64_t row, int64_t col, const std::string &token, int64_t expected, int64_t actual);
        int read_cells(const std::string &row_text, int64_t row_idx, std::vector<T> &cells);
        int read_plain(const std::string &text, std::vector<std::vector<T>> &rows);
        int read_bracketed(const std::string &text, size_t pos, std::vector<std::vector<T>> &rows);
};

// -----------------------------------------------------------------------------
template <typename T>
int MatrixParser<T>::fail(
    int kind,
    int64_t row,
    int64_t col,
    const std::string &token,
    int64_t expected,
    int64_t actual
) {
    this->error.kind = kind;
    this->error.row = row;
    this->error.col = col;
    this->error.token = token;
    this->error.expected = expected;
    this->error.actual = actual;

    std::string what = this->row_word();
    switch (kind) {
        case EmptyInput:
            this->error.message = (cur_arity == Arity::VectorList)
                ? "empty input: no vectors to read"
                : "empty matrix: no rows to read";
            break;
        case MalformedToken:
            if (col > 0) {
                this->error.message = what + " " + std::to_string(row) + ", column " + std::to_string(col)
                    + ": \"" + token + "\" is not a real number";
            } else if (row > 0) {
                this->error.message = what + " " + std::to_string(row) + ": malformed bracketed list near \"" + token + "\"";
            } else {
                this->error.message = "malformed bracketed list near \"" + token + "\"";
            }
            break;
        case RaggedRows:
            if (cur_arity == Arity::VectorList) {
                this->error.message = "vector " + std::to_string(row) + " has dimension " + std::to_string(actual)
                    + ", expected " + std::to_string(expected);
            } else {
                this->error.message = "row " + std::to_string(row) + " has " + std::to_string(actual)
                    + " entries, expected " + std::to_string(expected);
            }
            break;
        default:
            this->error.message = status_name(kind);
    }

    if (this->verbose)
        LINCALC_STATUS("parse failed: " << this->error.message);
    return kind;
}

// -----------------------------------------------------------------------------
template <typename T>
int MatrixParser<T>::read_cells(
    const std::string &row_text,
    int64_t row_idx,
    std::vector<T> &cells
) {
    std::vector<std::string> tokens = parse::tokenize_row(row_text);
    cells.assign(tokens.size(), 0.0);
    for (size_t j = 0; j < tokens.size(); ++j) {
        if (!parse::to_real(tokens[j], cells[j]))
            return this->fail(MalformedToken, row_idx, (int64_t) j + 1, tokens[j], 0, 0);
    }
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int MatrixParser<T>::read_plain(
    const std::string &text,
    std::vector<std::vector<T>> &rows
) {
    std::vector<std::string> row_texts = parse::split_rows(text);
    for (const auto &r : row_texts) {
        std::vector<T> cells;
        int err = this->read_cells(r, (int64_t) rows.size() + 1, cells);
        if (err)
            return err;
        rows.push_back(std::move(cells));
    }
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int MatrixParser<T>::read_bracketed(
    const std::string &text,
    size_t pos,
    std::vector<std::vector<T>> &rows
) {
    size_t n = text.size();
    auto skip_blanks = [&]() {
        while (pos < n && parse::is_blank(text[pos]))
            ++pos;
    };
    // pos sits on the outer '['
    ++pos;
    skip_blanks();

    if (pos < n && text[pos] != '[') {
        // Flat list: "[1, 2, 3]" or "[1 2; 3 4]"
        size_t close = text.find_first_of("[]", pos);
        if (close == std::string::npos)
            return this->fail(MalformedToken, 0, 0, parse::excerpt(text, pos), 0, 0);
        if (text[close] == '[')
            return this->fail(MalformedToken, 0, 0, parse::excerpt(text, close), 0, 0);
        int err = this->read_plain(text.substr(pos, close - pos), rows);
        if (err)
            return err;
        pos = close + 1;
    } else {
        // Nested list: "[[1, 2], [3, 4]]"
        bool closed = false;
        while (pos < n) {
            if (text[pos] == ']') {
                ++pos;
                closed = true;
                break;
            }
            if (text[pos] != '[')
                return this->fail(MalformedToken, (int64_t) rows.size() + 1, 0, parse::excerpt(text, pos), 0, 0);

            size_t close = text.find_first_of("[]", pos + 1);
            if (close == std::string::npos || text[close] == '[') {
                size_t at = (close == std::string::npos) ? pos : close;
                return this->fail(MalformedToken, (int64_t) rows.size() + 1, 0, parse::excerpt(text, at), 0, 0);
            }
            std::string inner = text.substr(pos + 1, close - pos - 1);
            if (inner.find(';') != std::string::npos)
                return this->fail(MalformedToken, (int64_t) rows.size() + 1, 0, parse::excerpt(text, pos), 0, 0);

            std::vector<T> cells;
            int err = this->read_cells(inner, (int64_t) rows.size() + 1, cells);
            if (err)
                return err;
            rows.push_back(std::move(cells));

            pos = close + 1;
            skip_blanks();
            // one optional separator between rows, a trailing one is allowed
            if (pos < n && (text[pos] == ',' || text[pos] == ';')) {
                ++pos;
                skip_blanks();
            }
        }
        if (!closed)
            return this->fail(MalformedToken, 0, 0, parse::excerpt(text, text.find('[')), 0, 0);
    }

    skip_blanks();
    if (pos < n)
        return this->fail(MalformedToken, 0, 0, parse::excerpt(text, pos), 0, 0);
    return Ok;
}

// -----------------------------------------------------------------------------
template <typename T>
int MatrixParser<T>::call(
    const std::string &text,
    Arity arity,
    DenseMatrix<T> &M
) {
    this->error = ParseError();
    this->cur_arity = arity;

    std::vector<std::vector<T>> rows;
    size_t first = 0;
    while (first < text.size() && parse::is_blank(text[first]))
        ++first;
    if (first == text.size())
        return this->fail(EmptyInput, 0, 0, "", 0, 0);

    int err;
    if (text[first] != '[')
        err = this->read_plain(text, rows);
    else if (parse::bare_row_list(text, first))
        err = this->read_bracketed("[" + text.substr(first) + "]", 0, rows);
    else
        err = this->read_bracketed(text, first, rows);
    if (err)
        return err;

    if (rows.empty())
        return this->fail(EmptyInput, 0, 0, "", 0, 0);

    int64_t expected = (int64_t) rows[0].size();
    for (size_t i = 1; i < rows.size(); ++i) {
        if ((int64_t) rows[i].size() != expected)
            return this->fail(RaggedRows, (int64_t) i + 1, 0, "", expected, (int64_t) rows[i].size());
    }
    if (expected == 0)
        return this->fail(EmptyInput, 0, 0, "", 0, 0);

    int64_t m = (int64_t) rows.size();
    if (arity == Arity::Matrix) {
        M = DenseMatrix<T>(rows);
    } else {
        // one vector per column
        M.reshape(expected, m);
        for (int64_t j = 0; j < m; ++j)
            for (int64_t i = 0; i < expected; ++i)
                M(i, j) = rows[j][i];
    }

    if (this->verbose)
        LINCALC_STATUS("parsed " << M.n_rows << "x" << M.n_cols << (arity == Arity::VectorList ? " vector set" : " matrix"));
    return Ok;
}

} // end namespace LinCalc
