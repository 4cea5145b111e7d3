// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "tracefit/cli.hpp"
#include "tracefit/report.hpp"
#include "tracefit/search.hpp"
#include "tracefit/test.hpp"
#include "tracefit/trace.hpp"
#include "tracefit/transducer.hpp"
#include "tracefit/utils.hpp"
#include "tracefit/z3_solver.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef TRACEFIT_USE_OPENMP
#include <omp.h>
#endif

namespace tracefit {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--verify") {
            opts.verify = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--dot") {
            opts.show_dot = true;
        } else if (arg == "--json") {
            opts.show_json = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--model") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--model requires a file argument");
            }
            opts.model_path = argv[++i];
        } else if (arg == "--threads" || arg == "-j") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--threads requires a number argument");
            }
            opts.num_threads = std::stoi(argv[++i]);
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple inputs not supported");
            }
            opts.input = arg;
        }
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] [<trace> | <traces.txt>]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Minimum-cost transducer completion for an input/output trace.\n"
        << "\n"
        << "A trace is a string of binary symbols, three per step: two input\n"
        << "bits and the required output bit.  Other characters are ignored.\n"
        << "Without an input the built-in demo traces are solved.\n"
        << "\n"
        << "Options:\n"
        << "  <trace> | <traces.txt>  Trace, or file with one trace per line\n"
        << "  --model <file>  Predefined transitions ('FROM INPUT TO OUTPUT' per line)\n"
        << "  --verify      Cross-check each cost with the Z3 optimiser\n"
        << "  --stats       Show engine statistics\n"
        << "  --dot         Print the completed transducer as Graphviz DOT\n"
        << "  --json        Print the completed transducer as JSON\n"
        << "  --threads N, -j N  Solve traces in parallel (0 = auto, default)\n"
        << "  --selftest    Run built-in tests\n"
        << "  --help, -h    Show this message\n"
        << "\n"
        << "Input format:\n"
        << "  - One trace per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── demo_traces ─────────────────────────────────────────────────────────────

const std::vector<std::string>& demo_traces() {
    static const std::vector<std::string> traces = {
        "001_010_010_101_100_001_110_110",
        "111_010_000_100_110_101_110_000",
    };
    return traces;
}

// ── solve_trace ─────────────────────────────────────────────────────────────
// Everything printed for one trace.  Kept in buffers so that traces solved
// in parallel can be printed in input order.

namespace {

struct TraceOutput {
    std::string out;
    std::string err;
    bool        ok = true;
};

TraceOutput solve_trace(const TransducerModel& model, const std::string& trace,
                        const Options& opts) {
    TraceOutput result;
    std::ostringstream out;
    std::ostringstream err;

    try {
        std::vector<Step> steps = decode_trace(trace);

        SearchEngine engine(model);
        auto completion = engine.solve(steps);

        if (!completion) {
            out << format_no_solution();
            result.ok = false;
        } else {
            out << format_report(model, *completion);

            CompletedTransducer machine(model, *completion);
            auto produced = simulate(machine, steps);
            if (!produced || *produced != required_outputs(steps)) {
                err << "ERROR: completed transducer does not reproduce the trace\n";
                result.ok = false;
            }

            if (opts.show_stats) {
                out << "  Stats: " << engine.stats().to_string()
                    << " time=" << completion->elapsed_s << "s\n";
            }

            if (opts.verify) {
                OptimalityChecker checker(model);
                Z3Result verdict = checker.optimise(steps);
                if (verdict != Z3Result::SAT) {
                    err << "WARN: Z3 verification inconclusive ("
                        << z3_result_name(verdict) << ")\n";
                } else if (checker.cost() != completion->cost) {
                    err << "ERROR: Z3 optimum " << checker.cost()
                        << " differs from search cost " << completion->cost
                        << " (Z3 path: " << checker.get_model() << ")\n";
                    result.ok = false;
                } else {
                    out << "  Verified: Z3 optimum = " << checker.cost() << "\n";
                }
            }

            if (opts.show_dot) {
                out << "\n" << machine.to_dot();
            }
            if (opts.show_json) {
                out << "\n" << machine.to_json();
            }
        }
    } catch (const std::exception& e) {
        err << "ERROR: " << e.what() << "\n";
        result.ok = false;
    }

    result.out = out.str();
    result.err = err.str();
    return result;
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver.  Loads the model, collects the traces, solves them and
// prints results in input order.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    // ── Load model ──────────────────────────────────────────────────────
    std::optional<TransducerModel> model;
    try {
        model = opts.model_path.empty() ? TransducerModel::builtin()
                                        : load_model(opts.model_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    // ── Collect traces ──────────────────────────────────────────────────
    std::vector<std::string> traces;
    const bool demo = opts.input.empty();
    if (demo) {
        traces = demo_traces();
    } else if (opts.input.ends_with(".txt")) {
        std::vector<std::string> lines;
        try {
            lines = read_lines(opts.input);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
        for (const auto& line : lines) {
            std::string content = strip_comment(line);
            if (!content.empty()) traces.push_back(content);
        }
    } else {
        traces.push_back(opts.input);
    }

    // ── Solve ───────────────────────────────────────────────────────────
    std::vector<TraceOutput> results(traces.size());
    const auto count = static_cast<std::ptrdiff_t>(traces.size());

#ifdef TRACEFIT_USE_OPENMP
    if (opts.num_threads > 0) omp_set_num_threads(opts.num_threads);
    #pragma omp parallel for schedule(dynamic) if(opts.num_threads != 1 && count > 1)
#endif
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        results[i] = solve_trace(*model, traces[i], opts);
    }

    // ── Print ───────────────────────────────────────────────────────────
    bool had_errors = false;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (demo) {
            std::cout << std::string(30, '-') << "\n"
                      << "Testing case " << (i + 1) << ":\n"
                      << traces[i] << "\n\n";
        } else if (results.size() > 1) {
            std::cout << (i + 1) << ": " << traces[i] << "\n";
        }
        std::cout << results[i].out;
        std::cerr << results[i].err;
        if (demo || results.size() > 1) std::cout << "\n";
        if (!results[i].ok) had_errors = true;
    }

    return had_errors ? 1 : 0;
}

}  // namespace tracefit
