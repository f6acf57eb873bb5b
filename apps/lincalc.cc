#include "LinCalc.hh"

#include <RandBLAS.hh>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace LinCalc;

using RNGState_t = RandBLAS::RNGState<r123::Philox4x32>;

static void print_usage(std::ostream &out) {
    out << "usage: lincalc [options] <op> <operand>...\n"
        << "       lincalc [options] random <rows> <cols>\n"
        << "       lincalc [options]            (session: one request per line)\n"
        << "\noperations:\n";
    for (const auto &entry : operation_table())
        out << "  " << entry.usage << "\n";
    out << "\noperands are matrix text such as \"[[1,2],[3,4]]\", \"1 2; 3 4\" or \"1,2\\n3,4\",\n"
        << "@path to read a file, or - to read stdin.\n"
        << "in a session, separate operands with '|', e.g.  add 1 2; 3 4 | 5 6; 7 8\n"
        << "\noptions:\n"
        << "  --precision N     decimals shown (default 2)\n"
        << "  --tol X           zero tolerance (default 1e-10)\n"
        << "  --alpha X         lincomb coefficient of A (default 1)\n"
        << "  --beta X          lincomb coefficient of B (default 1)\n"
        << "  --alpha-det       use det(C) for alpha\n"
        << "  --beta-det        use det(C) for beta\n"
        << "  --seed N          seed for random matrices (default 0)\n"
        << "  --range LO HI     entry range for random matrices (default -9 9)\n"
        << "  --multiline       print one matrix row per line\n"
        << "  -v, --verbose     print status lines\n"
        << "  -h, --help        show this message\n";
}

// Resolves "@path" and "-" into the text they name.
static std::string load_operand(const std::string &arg) {
    if (arg == "-") {
        std::stringstream buf;
        buf << std::cin.rdbuf();
        return buf.str();
    }
    if (arg.size() > 1 && arg[0] == '@') {
        std::ifstream file(arg.substr(1));
        if (!file)
            throw std::invalid_argument("cannot read " + arg.substr(1));
        std::stringstream buf;
        buf << file.rdbuf();
        return buf.str();
    }
    return arg;
}

static int run_random(
    const std::vector<std::string> &args,
    const CalcConfig &cfg,
    RNGState_t &state
) {
    if (args.size() != 2)
        throw std::invalid_argument("random expects <rows> <cols>");
    int64_t m = config::to_int("rows", args[0]);
    int64_t n = config::to_int("cols", args[1]);
    if (m <= 0 || n <= 0)
        throw std::invalid_argument("random needs positive <rows> and <cols>");
    if (!gen::random_size_ok(m, n))
        throw std::invalid_argument("random matrix too large (at most " + std::to_string(gen::MAX_RANDOM_ENTRIES) + " entries)");

    DenseMatrix<double> A;
    state = gen::random_int_matrix(m, n, cfg.rand_low, cfg.rand_high, A, state);
    std::cout << util::format_matrix(A, 0, cfg.multiline) << std::endl;
    return 0;
}

static int run_request(
    Calculator<double> &calc,
    const CalcConfig &cfg,
    Operation op,
    const std::vector<std::string> &operands
) {
    OpRequest<double> req(op, operands);
    req.alpha = cfg.alpha;
    req.beta = cfg.beta;
    req.alpha_det = cfg.alpha_det;
    req.beta_det = cfg.beta_det;

    OpResult<double> res;
    int err = calc.call(req, res);
    if (err) {
        std::cerr << res.render(cfg.precision, cfg.multiline);
        return 1;
    }
    std::cout << res.render(cfg.precision, cfg.multiline);
    return 0;
}

static std::vector<std::string> split_operands(const std::string &text) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : text) {
        if (c == '|') {
            parts.push_back(parse::trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string last = parse::trim(cur);
    if (!last.empty() || !parts.empty())
        parts.push_back(last);
    return parts;
}

// Reads requests from stdin until "quit", "exit" or end of input.
// A failed request is reported and the session carries on.
static int run_session(
    Calculator<double> &calc,
    const CalcConfig &cfg,
    RNGState_t &state
) {
    int last = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        std::string req = parse::trim(line);
        if (req.empty() || req[0] == '#')
            continue;

        size_t split = 0;
        while (split < req.size() && !parse::is_blank(req[split]))
            ++split;
        std::string name = req.substr(0, split);
        std::string rest = parse::trim(req.substr(split));

        if (name == "quit" || name == "exit")
            break;
        if (name == "help") {
            print_usage(std::cout);
            continue;
        }
        try {
            if (name == "random") {
                std::vector<std::string> args = parse::tokenize_row(rest);
                last = run_random(args, cfg, state);
                continue;
            }
            Operation op;
            if (!operation_from_name(name, op)) {
                std::cerr << "unknown operation \"" << name << "\" (try help)" << std::endl;
                last = 1;
                continue;
            }
            std::vector<std::string> operands = split_operands(rest);
            for (auto &o : operands)
                o = load_operand(o);
            last = run_request(calc, cfg, op, operands);
        } catch (const std::invalid_argument &e) {
            std::cerr << "error: " << e.what() << std::endl;
            last = 1;
        } catch (const std::exception &e) {
            LINCALC_ERROR(e.what());
            last = 1;
        }
    }
    return last;
}

int main(int argc, char** argv) {
    CalcConfig cfg;
    std::vector<std::string> positional;
    try {
        parse_args(argc, argv, cfg, positional);
    } catch (const std::invalid_argument &e) {
        std::cerr << "lincalc: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }
    if (cfg.help) {
        print_usage(std::cout);
        return 0;
    }

    LapackArrayOps<double> ops(cfg.verbose);
    EigenReducer<double> reducer(cfg.zero_tol, cfg.verbose);
    MatrixParser<double> parser(cfg.verbose);
    Calculator<double> calc(ops, reducer, parser, cfg);
    RNGState_t state(cfg.seed);

    if (positional.empty())
        return run_session(calc, cfg, state);

    std::vector<std::string> args(positional.begin() + 1, positional.end());
    try {
        if (positional[0] == "random")
            return run_random(args, cfg, state);

        Operation op;
        if (!operation_from_name(positional[0], op))
            throw std::invalid_argument("unknown operation \"" + positional[0] + "\"");
        for (auto &a : args)
            a = load_operand(a);
        return run_request(calc, cfg, op, args);
    } catch (const std::invalid_argument &e) {
        std::cerr << "lincalc: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    } catch (const std::exception &e) {
        LINCALC_ERROR(e.what());
        return 1;
    }
}
