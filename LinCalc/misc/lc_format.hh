#pragma once

#include "lc_matrix.hh"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace LinCalc::util {

/// Compact rendering of a real: rounded to `decimals` places, no decimal
/// point for integral values and no trailing zeros otherwise. A nonzero
/// value that would round to zero keeps `decimals` significant digits in
/// exponent notation instead.
/// format_number(2.0, 2) == "2", format_number(0.125, 2) == "0.13",
/// format_number(-1e-9, 2) == "-1e-09".
template <typename T>
std::string format_number(
    T x,
    int decimals
) {
    if (decimals < 0)
        decimals = 0;
    double scale = std::pow(10.0, decimals);
    double v = std::round((double) x * scale) / scale;
    std::ostringstream out;
    if (v == 0.0 && x != 0 && std::isfinite((double) x)) {
        out << std::setprecision(std::max(decimals, 1)) << (double) x;
        return out.str();
    }
    if (v == 0.0)
        v = 0.0; // drops the sign of -0

    if (std::abs(v - std::round(v)) < 0.5 / scale) {
        out << std::fixed << std::setprecision(0) << std::round(v);
        std::string s = out.str();
        return (s == "-0") ? "0" : s;
    }
    out << std::fixed << std::setprecision(decimals) << v;
    std::string s = out.str();
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0')
            s.pop_back();
        if (!s.empty() && s.back() == '.')
            s.pop_back();
    }
    return s;
}

/// Bracketed-list rendering, "[[1, 2], [3, 4]]". With `multiline` set,
/// each row goes on its own line. The output is valid parser input.
template <typename T>
std::string format_matrix(
    const DenseMatrix<T> &M,
    int decimals,
    bool multiline
) {
    if (M.empty())
        return "[]";
    std::string out = "[";
    for (int64_t i = 0; i < M.n_rows; ++i) {
        if (i > 0)
            out += multiline ? ",\n " : ", ";
        out += "[";
        for (int64_t j = 0; j < M.n_cols; ++j) {
            if (j > 0)
                out += ", ";
            out += format_number(M(i, j), decimals);
        }
        out += "]";
    }
    out += "]";
    return out;
}

/// 1-based, comma separated list of indices, e.g. "{1, 3}".
inline std::string format_indices(
    const std::vector<int64_t> &idx
) {
    std::string out = "{";
    for (size_t i = 0; i < idx.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += std::to_string(idx[i] + 1);
    }
    out += "}";
    return out;
}

} // end namespace LinCalc::util
