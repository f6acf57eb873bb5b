#pragma once

#include "lc_gen.hh"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace LinCalc {

/// Everything that changes how a request is evaluated or displayed.
/// Passed by value to the driver and the front end; there is no global state.
struct CalcConfig {
    int precision = 2;          // decimals shown in results
    double zero_tol = 1e-10;    // |x| <= zero_tol is treated as zero
    bool verbose = false;
    bool multiline = false;     // one matrix row per output line
    int64_t rand_low = -9;
    int64_t rand_high = 9;
    uint64_t seed = 0;
    // coefficients of alpha*A + beta*B
    double alpha = 1.0;
    double beta = 1.0;
    bool alpha_det = false;     // alpha := det(C)
    bool beta_det = false;      // beta := det(C)
    bool help = false;
};

namespace config {

inline bool is_option(const std::string &arg) {
    if (arg.size() < 2 || arg[0] != '-')
        return false;
    // "-3 1; 2 4" is a matrix, not a flag
    char c = arg[1];
    return !((c >= '0' && c <= '9') || c == '.' || c == ' ');
}

inline double to_double(const std::string &flag, const std::string &val) {
    try {
        size_t used = 0;
        double d = std::stod(val, &used);
        if (used != val.size())
            throw std::invalid_argument(val);
        return d;
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + " expects a number, got \"" + val + "\"");
    }
}

inline int64_t to_int(const std::string &flag, const std::string &val) {
    try {
        size_t used = 0;
        long long i = std::stoll(val, &used);
        if (used != val.size())
            throw std::invalid_argument(val);
        return (int64_t) i;
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + " expects an integer, got \"" + val + "\"");
    }
}

} // end namespace config

/// Reads command-line flags into cfg and collects everything else, in
/// order, into positional. Throws std::invalid_argument on an unknown flag,
/// a missing or malformed value, or an out-of-range setting.
inline void parse_args(
    int argc,
    char** argv,
    CalcConfig &cfg,
    std::vector<std::string> &positional
) {
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || !config::is_option(arg)) {
            positional.push_back(arg);
            continue;
        }
        auto next = [&](const std::string &flag) -> std::string {
            if (i + 1 >= argc)
                throw std::invalid_argument(flag + " expects a value");
            return argv[++i];
        };

        if (arg == "--") {
            options_done = true;
        } else if (arg == "--precision") {
            int64_t p = config::to_int(arg, next(arg));
            if (p < 0 || p > 15)
                throw std::invalid_argument("--precision must be between 0 and 15");
            cfg.precision = (int) p;
        } else if (arg == "--tol") {
            cfg.zero_tol = config::to_double(arg, next(arg));
            if (cfg.zero_tol < 0)
                throw std::invalid_argument("--tol must be non-negative");
        } else if (arg == "--alpha") {
            cfg.alpha = config::to_double(arg, next(arg));
        } else if (arg == "--beta") {
            cfg.beta = config::to_double(arg, next(arg));
        } else if (arg == "--alpha-det") {
            cfg.alpha_det = true;
        } else if (arg == "--beta-det") {
            cfg.beta_det = true;
        } else if (arg == "--seed") {
            int64_t s = config::to_int(arg, next(arg));
            if (s < 0)
                throw std::invalid_argument("--seed must be non-negative");
            cfg.seed = (uint64_t) s;
        } else if (arg == "--range") {
            cfg.rand_low = config::to_int(arg, next(arg));
            cfg.rand_high = config::to_int(arg, next(arg));
            if (cfg.rand_low > cfg.rand_high)
                throw std::invalid_argument("--range needs LO <= HI");
            if (!gen::random_range_ok(cfg.rand_low, cfg.rand_high))
                throw std::invalid_argument("--range bounds must lie within +-2^52");
        } else if (arg == "--multiline") {
            cfg.multiline = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.help = true;
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
}

} // end namespace LinCalc
