// ============================================================================
// tracefit/z3_solver.hpp — Z3 optimisation encoding of trace completion
// ============================================================================
//
// An independent formulation of the completion problem, used to cross-check
// the search engine.  For a trace of n steps over a model with P predefined
// states:
//
//   - states are the integers [0, P + n); indices >= P are synthesized;
//   - s_0 … s_n are the states visited, with s_0 < P;
//   - for every input symbol a, dest_a : Int -> Int and out_a : Int -> Bool
//     describe the completed machine; predefined entries are pinned;
//   - step i requires dest_{in_i}(s_i) = s_{i+1} and out_{in_i}(s_i) = req_i.
//
// The objective counts the non-predefined (state, input) pairs the path
// uses plus the synthesized states it visits.  Because dest/out are
// functions, a pair used twice is paid once and can never carry two
// different outputs, which mirrors the search engine's reuse rule.
//
// Usage:
//   OptimalityChecker checker(model);
//   if (checker.optimise(steps) == Z3Result::SAT) {
//       int best = checker.cost();
//   }
//
// ============================================================================

#ifndef TRACEFIT_Z3_SOLVER_HPP
#define TRACEFIT_Z3_SOLVER_HPP

#include "tracefit/trace.hpp"
#include "tracefit/transducer.hpp"

#include <z3++.h>

#include <optional>
#include <string>
#include <vector>

namespace tracefit {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

const char* z3_result_name(Z3Result r) noexcept;

// ── OptimalityChecker ───────────────────────────────────────────────────────

class OptimalityChecker {
public:
    explicit OptimalityChecker(const TransducerModel& model);

    /// Minimise the completion cost of `steps`.
    Z3Result optimise(const std::vector<Step>& steps);

    /// Optimal cost found by the last optimise() call returning SAT.
    int cost() const noexcept { return cost_; }

    /// Visited states of the last optimum, e.g. "S0 S2 N1 S3".  Synthesized
    /// states are numbered by first visit.
    std::string get_model() const { return visited_; }

    /// Convenience wrapper: the optimum, or nullopt if Z3 found none.
    std::optional<int> minimum_cost(const std::vector<Step>& steps);

private:
    const TransducerModel& model_;
    z3::context            ctx_;

    int         cost_ = 0;
    std::string visited_;
};

}  // namespace tracefit

#endif  // TRACEFIT_Z3_SOLVER_HPP
