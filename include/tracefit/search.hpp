// ============================================================================
// tracefit/search.hpp — Extension-aware minimum-cost completion search
// ============================================================================
//
// Given a predefined TransducerModel and a decoded trace, the engine finds a
// start state and a path through the machine that reproduces every required
// output, adding transitions (and, if needed, new states) where the table
// has none.  The path minimises
//
//     cost = (#added transitions) + (#synthesized states)
//
// Algorithm Overview:
// ───────────────────
// For each predefined start state, a depth-first search walks the trace one
// step at a time.  At a step (input, output) from state q:
//
//   1. a predefined transition q --input/output--> p is taken for free;
//   2. otherwise an extension added earlier on this branch is reused for
//      free if its output matches;
//   3. if neither the table nor the branch defines (q, input), a new
//      transition to any existing state is added (cost 1), or
//   4. a new state is synthesized and targeted (cost 2).
//
// A defined transition whose output differs from the required one closes
// the branch; existing transitions are never overwritten.
//
// Ties are resolved by evaluation order (1, 2, 3 in State order, then 4):
// a later option only wins with a strictly lower cost.  Start states are
// tried in index order under the same rule.
//
// Memoization:
// ────────────
// Sub-problems are keyed by SearchNode = (step index, state, extension set,
// synthesized count), compared by value.  The memo table belongs to a
// SearchSession that lives for exactly one solve() call.
//
// ============================================================================

#ifndef TRACEFIT_SEARCH_HPP
#define TRACEFIT_SEARCH_HPP

#include "tracefit/extension_set.hpp"
#include "tracefit/trace.hpp"
#include "tracefit/transducer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracefit {

// ── StepKind ────────────────────────────────────────────────────────────────
// How a path step was satisfied.

enum class StepKind : std::uint8_t {
    Predefined,     // transition from the model table
    Reused,         // extension added earlier on the same path
    Extra,          // new transition to an existing state
    ExtraNewState   // new transition to a newly synthesized state
};

const char* step_kind_name(StepKind kind) noexcept;

// ── PathStep ────────────────────────────────────────────────────────────────

struct PathStep {
    State        from;
    InputSymbol  input = 0;
    OutputSymbol output = '0';
    State        to;
    StepKind     kind = StepKind::Predefined;

    bool is_extra() const noexcept {
        return kind == StepKind::Extra || kind == StepKind::ExtraNewState;
    }
    bool creates_state() const noexcept { return kind == StepKind::ExtraNewState; }

    bool operator==(const PathStep& o) const noexcept {
        return from == o.from && input == o.input && output == o.output &&
               to == o.to && kind == o.kind;
    }
};

// ── Completion ──────────────────────────────────────────────────────────────
// The cheapest way to reproduce a trace.

struct Completion {
    State                 start;
    int                   cost = 0;
    std::vector<PathStep> path;
    std::size_t           added_transitions = 0;
    std::size_t           synthesized_states = 0;
    ExtensionSet          extensions;     // every transition added on the path
    double                elapsed_s = 0.0;
};

// ── SearchNode ──────────────────────────────────────────────────────────────
// Memoization key.

struct SearchNode {
    std::size_t   index = 0;
    State         state;
    ExtensionSet  extensions;
    std::uint32_t synthesized = 0;

    bool operator==(const SearchNode& o) const {
        return index == o.index && state == o.state &&
               synthesized == o.synthesized && extensions == o.extensions;
    }
};

struct SearchNodeHash {
    std::size_t operator()(const SearchNode& key) const noexcept;
};

// ── SearchStats ─────────────────────────────────────────────────────────────

struct SearchStats {
    std::uint64_t nodes_expanded = 0;
    std::uint64_t memo_hits = 0;
    std::uint64_t memo_entries = 0;
    std::uint64_t extension_candidates = 0;
    std::uint64_t start_states = 0;
    std::size_t   max_depth = 0;

    void reset() noexcept { *this = SearchStats{}; }

    std::string to_string() const;
};

// ── SearchSession ───────────────────────────────────────────────────────────
// State of one solve() call: the trace, the model and the memo table.
// Sessions are created by SearchEngine::solve() and discarded on return.

class SearchSession {
public:
    SearchSession(const TransducerModel& model, const std::vector<Step>& steps,
                  SearchStats& stats);

    SearchSession(const SearchSession&) = delete;
    SearchSession& operator=(const SearchSession&) = delete;

    /// Best completion of the trace from `start` with no prior extensions.
    std::optional<Completion> complete_from(State start);

    std::size_t memo_size() const noexcept { return memo_.size(); }

private:
    // Singly linked path suffix; memo entries share their tails.
    struct PathLink {
        PathStep                        step;
        std::shared_ptr<const PathLink> next;
    };

    struct Outcome {
        int                             cost = 0;
        std::shared_ptr<const PathLink> path;
        ExtensionSet                    extensions;   // at the end of the path
    };

    std::optional<Outcome> explore(std::size_t index, State state,
                                   const ExtensionSet& extensions,
                                   std::uint32_t synthesized);

    // Evaluate one option and keep it if strictly cheaper than `best`.
    void consider(std::optional<Outcome>& best, std::size_t index, State from,
                  StepKind kind, State to, const ExtensionSet& extensions,
                  std::uint32_t synthesized, int step_cost);

    // Predefined states followed by every destination already added on this
    // branch, sorted and unique.
    std::vector<State> existing_states(const ExtensionSet& extensions) const;

    const TransducerModel&   model_;
    const std::vector<Step>& steps_;
    SearchStats&             stats_;

    std::unordered_map<SearchNode, std::optional<Outcome>, SearchNodeHash> memo_;
};

// ── SearchEngine ────────────────────────────────────────────────────────────

class SearchEngine {
public:
    explicit SearchEngine(const TransducerModel& model) : model_(model) {}

    /// Cheapest completion over all predefined start states, or nullopt if
    /// no start state admits one.
    std::optional<Completion> solve(const std::vector<Step>& steps);

    /// Statistics of the last solve() call.
    const SearchStats& stats() const noexcept { return stats_; }

    const TransducerModel& model() const noexcept { return model_; }

private:
    const TransducerModel& model_;
    SearchStats            stats_;
};

}  // namespace tracefit

#endif  // TRACEFIT_SEARCH_HPP
