// ============================================================================
// tracefit/report.hpp — Completion report and completed transducer
// ============================================================================
//
// format_report() renders a Completion as
//
//     Start Node = S0
//     Extra Cost = 3
//     Extra Path = 2
//     Extra Node = 1
//     Path:
//     S0 --(01/1)--> S1
//     S1 --(00/1)--> N1 (extra, new node)
//     N1 --(11/0)--> S2 (extra)
//
// CompletedTransducer is the predefined table merged with the transitions a
// completion added.  It can be simulated on a trace and serialised as text,
// Graphviz DOT or JSON.
//
// ============================================================================

#ifndef TRACEFIT_REPORT_HPP
#define TRACEFIT_REPORT_HPP

#include "tracefit/extension_set.hpp"
#include "tracefit/search.hpp"
#include "tracefit/trace.hpp"
#include "tracefit/transducer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tracefit {

// ── Text report ─────────────────────────────────────────────────────────────

/// Render one path step as "from --(in/out)--> to" plus its annotation.
std::string format_step(const TransducerModel& model, const PathStep& step);

/// Full report for a completion.
std::string format_report(const TransducerModel& model, const Completion& completion);

/// Report printed when no start state admits a completion.
std::string format_no_solution();

// ── CompletedTransducer ─────────────────────────────────────────────────────

class CompletedTransducer {
public:
    CompletedTransducer(const TransducerModel& model, const Completion& completion);

    /// Transition of the completed machine: predefined first, then added.
    std::optional<Edge> lookup(State state, InputSymbol input) const;

    /// Every state of the completed machine, in State order.
    const std::vector<State>& states() const noexcept { return states_; }

    State start() const noexcept { return start_; }

    // ── Serialisation ───────────────────────────────────────────────────
    std::string to_string() const;
    std::string to_dot()    const;
    std::string to_json()   const;

private:
    struct Row {
        Transition t;
        bool       added = false;
    };
    std::vector<Row> rows() const;

    const TransducerModel& model_;
    State                  start_;
    ExtensionSet           extensions_;
    std::vector<State>     states_;
};

/// Run the completed machine from its start state on the trace inputs and
/// return the emitted outputs.  nullopt if a step has no transition.
std::optional<std::string> simulate(const CompletedTransducer& machine,
                                    const std::vector<Step>& steps);

/// Required outputs of a trace, in order.
std::string required_outputs(const std::vector<Step>& steps);

}  // namespace tracefit

#endif  // TRACEFIT_REPORT_HPP
