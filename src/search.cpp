// ============================================================================
// search.cpp — Extension-aware minimum-cost completion search
// ============================================================================

#include "tracefit/search.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace tracefit {

// ============================================================================
// StepKind
// ============================================================================

const char* step_kind_name(StepKind kind) noexcept {
    switch (kind) {
        case StepKind::Predefined:    return "predefined";
        case StepKind::Reused:        return "reused";
        case StepKind::Extra:         return "extra";
        case StepKind::ExtraNewState: return "extra, new node";
    }
    return "?";
}

// ============================================================================
// SearchNodeHash
// ============================================================================

std::size_t SearchNodeHash::operator()(const SearchNode& key) const noexcept {
    std::size_t h = std::hash<std::size_t>{}(key.index);
    h ^= StateHash{}(key.state) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= key.extensions.hash() + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::uint32_t>{}(key.synthesized) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ============================================================================
// SearchStats
// ============================================================================

std::string SearchStats::to_string() const {
    std::ostringstream oss;
    oss << "starts=" << start_states
        << " nodes=" << nodes_expanded
        << " memo_entries=" << memo_entries
        << " memo_hits=" << memo_hits
        << " candidates=" << extension_candidates
        << " max_depth=" << max_depth;
    return oss.str();
}

// ============================================================================
// SearchSession
// ============================================================================

SearchSession::SearchSession(const TransducerModel& model,
                             const std::vector<Step>& steps,
                             SearchStats& stats)
    : model_(model), steps_(steps), stats_(stats) {}

std::optional<Completion> SearchSession::complete_from(State start) {
    auto outcome = explore(0, start, ExtensionSet{}, 0);
    if (!outcome) return std::nullopt;

    Completion c;
    c.start      = start;
    c.cost       = outcome->cost;
    c.extensions = outcome->extensions;
    for (const PathLink* link = outcome->path.get(); link != nullptr;
         link = link->next.get()) {
        c.path.push_back(link->step);
        if (link->step.is_extra()) ++c.added_transitions;
        if (link->step.creates_state()) ++c.synthesized_states;
    }
    return c;
}

std::vector<State> SearchSession::existing_states(const ExtensionSet& extensions) const {
    std::vector<State> states = model_.states();
    for (State s : extensions.destinations()) {
        states.push_back(s);
    }
    std::sort(states.begin(), states.end());
    states.erase(std::unique(states.begin(), states.end()), states.end());
    return states;
}

void SearchSession::consider(std::optional<Outcome>& best, std::size_t index,
                             State from, StepKind kind, State to,
                             const ExtensionSet& extensions,
                             std::uint32_t synthesized, int step_cost) {
    auto rest = explore(index + 1, to, extensions, synthesized);
    if (!rest) return;

    const int total = step_cost + rest->cost;
    if (best && total >= best->cost) return;

    const Step& step = steps_[index];
    auto link = std::make_shared<PathLink>();
    link->step = PathStep{from, step.input, step.output, to, kind};
    link->next = rest->path;

    best = Outcome{total, std::move(link), rest->extensions};
}

std::optional<SearchSession::Outcome>
SearchSession::explore(std::size_t index, State state,
                       const ExtensionSet& extensions,
                       std::uint32_t synthesized) {
    stats_.max_depth = std::max(stats_.max_depth, index);

    if (index == steps_.size()) {
        return Outcome{0, nullptr, extensions};
    }

    SearchNode key{index, state, extensions, synthesized};
    auto it = memo_.find(key);
    if (it != memo_.end()) {
        ++stats_.memo_hits;
        return it->second;
    }
    ++stats_.nodes_expanded;

    const Step& step = steps_[index];
    std::optional<Outcome> best;

    // 1. Predefined transition with the required output.
    const auto predefined = model_.lookup(state, step.input);
    if (predefined && predefined->output == step.output) {
        consider(best, index, state, StepKind::Predefined, predefined->to,
                 extensions, synthesized, 0);
    }

    // 2. Extension added earlier on this branch.
    const auto added = extensions.find(state, step.input);
    if (added && added->output == step.output) {
        consider(best, index, state, StepKind::Reused, added->to,
                 extensions, synthesized, 0);
    }

    // 3./4. (state, input) is undefined: add a transition.
    if (!predefined && !added) {
        for (State to : existing_states(extensions)) {
            ++stats_.extension_candidates;
            consider(best, index, state, StepKind::Extra, to,
                     extensions.with(state, step.input, Edge{to, step.output}),
                     synthesized, 1);
        }

        ++stats_.extension_candidates;
        const State fresh = State::synthesized(synthesized + 1);
        consider(best, index, state, StepKind::ExtraNewState, fresh,
                 extensions.with(state, step.input, Edge{fresh, step.output}),
                 synthesized + 1, 2);
    }

    memo_.emplace(std::move(key), best);
    return best;
}

// ============================================================================
// SearchEngine
// ============================================================================

std::optional<Completion> SearchEngine::solve(const std::vector<Step>& steps) {
    stats_.reset();
    const auto t_start = std::chrono::steady_clock::now();

    SearchSession session(model_, steps, stats_);
    std::optional<Completion> best;

    for (State start : model_.states()) {
        ++stats_.start_states;
        auto candidate = session.complete_from(start);
        if (!candidate) continue;
        if (best && candidate->cost >= best->cost) continue;
        best = std::move(candidate);
    }

    stats_.memo_entries = session.memo_size();

    if (best) {
        best->elapsed_s = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t_start).count();
    }
    return best;
}

}  // namespace tracefit
