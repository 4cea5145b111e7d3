// ============================================================================
// tracefit/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: load model → decode each trace → search → report.
//
// ============================================================================

#ifndef TRACEFIT_CLI_HPP
#define TRACEFIT_CLI_HPP

#include <string>
#include <vector>

namespace tracefit {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string input;        // trace, or path to a .txt file of traces
    std::string model_path;   // empty = built-in table
    bool        selftest = false;
    bool        verify = false;      // cross-check costs with Z3
    bool        show_stats = false;
    bool        show_dot = false;
    bool        show_json = false;
    bool        help = false;
    int         num_threads = 0;     // OpenMP threads for batches (0 = default)
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Traces solved when no input is given.
const std::vector<std::string>& demo_traces();

/// Main driver: solve every trace, print results.
/// Returns the process exit code (0 = ok, 1 = errors encountered).
int run(const Options& opts);

}  // namespace tracefit

#endif  // TRACEFIT_CLI_HPP
