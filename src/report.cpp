// ============================================================================
// report.cpp — Completion report and completed transducer
// ============================================================================

#include "tracefit/report.hpp"

#include <algorithm>
#include <sstream>

namespace tracefit {

// ============================================================================
// Text report
// ============================================================================

std::string format_step(const TransducerModel& model, const PathStep& step) {
    std::string line = model.name_of(step.from) + " --(" +
                       input_to_string(step.input) + "/" + step.output +
                       ")--> " + model.name_of(step.to);
    if (step.is_extra()) {
        line += std::string(" (") + step_kind_name(step.kind) + ")";
    }
    return line;
}

std::string format_report(const TransducerModel& model, const Completion& completion) {
    std::ostringstream oss;
    oss << "Start Node = " << model.name_of(completion.start) << "\n"
        << "Extra Cost = " << completion.cost << "\n"
        << "Extra Path = " << completion.added_transitions << "\n"
        << "Extra Node = " << completion.synthesized_states << "\n"
        << "Path:\n";
    for (const auto& step : completion.path) {
        oss << format_step(model, step) << "\n";
    }
    return oss.str();
}

std::string format_no_solution() {
    return "No valid path found.\n";
}

// ============================================================================
// CompletedTransducer
// ============================================================================

CompletedTransducer::CompletedTransducer(const TransducerModel& model,
                                         const Completion& completion)
    : model_(model), start_(completion.start), extensions_(completion.extensions) {
    states_ = model_.states();
    for (const auto& e : extensions_.entries()) {
        states_.push_back(e.from);
        states_.push_back(e.edge.to);
    }
    std::sort(states_.begin(), states_.end());
    states_.erase(std::unique(states_.begin(), states_.end()), states_.end());
}

std::optional<Edge> CompletedTransducer::lookup(State state, InputSymbol input) const {
    if (auto edge = model_.lookup(state, input)) return edge;
    return extensions_.find(state, input);
}

std::vector<CompletedTransducer::Row> CompletedTransducer::rows() const {
    std::vector<Row> out;
    for (const auto& t : model_.transitions()) {
        out.push_back(Row{t, false});
    }
    for (const auto& e : extensions_.entries()) {
        out.push_back(Row{Transition{e.from, e.input, e.edge.to, e.edge.output}, true});
    }
    std::stable_sort(out.begin(), out.end(), [](const Row& a, const Row& b) {
        if (a.t.from != b.t.from) return a.t.from < b.t.from;
        return a.t.input < b.t.input;
    });
    return out;
}

std::string CompletedTransducer::to_string() const {
    std::ostringstream oss;
    oss << "Transducer with " << states_.size() << " state(s), "
        << extensions_.size() << " added transition(s):\n";
    oss << "  Start state: " << model_.name_of(start_) << "\n";
    for (const auto& row : rows()) {
        oss << "  " << model_.name_of(row.t.from) << " --("
            << input_to_string(row.t.input) << "/" << row.t.output << ")--> "
            << model_.name_of(row.t.to);
        if (row.added) oss << " (added)";
        oss << "\n";
    }
    return oss.str();
}

std::string CompletedTransducer::to_dot() const {
    std::ostringstream oss;
    oss << "digraph Transducer {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=circle fontname=\"Helvetica\" fontsize=10];\n";
    oss << "  edge [fontname=\"Helvetica\" fontsize=9];\n";

    // Invisible entry arrow
    oss << "  __start [shape=none label=\"\"];\n";
    oss << "  __start -> " << model_.name_of(start_) << ";\n";

    for (State s : states_) {
        if (s.is_synthesized()) {
            oss << "  " << model_.name_of(s) << " [shape=box];\n";
        }
    }

    for (const auto& row : rows()) {
        oss << "  " << model_.name_of(row.t.from) << " -> " << model_.name_of(row.t.to)
            << " [label=\"" << input_to_string(row.t.input) << "/" << row.t.output << "\"";
        if (row.added) oss << " style=dashed";
        oss << "];\n";
    }

    oss << "}\n";
    return oss.str();
}

std::string CompletedTransducer::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"start\": \"" << model_.name_of(start_) << "\",\n";

    oss << "  \"states\": [";
    {
        bool first = true;
        for (State s : states_) {
            if (!first) oss << ", ";
            oss << "{\"name\": \"" << model_.name_of(s) << "\", \"synthesized\": "
                << (s.is_synthesized() ? "true" : "false") << "}";
            first = false;
        }
    }
    oss << "],\n";

    oss << "  \"transitions\": [\n";
    {
        const auto all = rows();
        for (std::size_t i = 0; i < all.size(); ++i) {
            const auto& row = all[i];
            oss << "    {\"from\": \"" << model_.name_of(row.t.from) << "\""
                << ", \"input\": \"" << input_to_string(row.t.input) << "\""
                << ", \"to\": \"" << model_.name_of(row.t.to) << "\""
                << ", \"output\": \"" << row.t.output << "\""
                << ", \"added\": " << (row.added ? "true" : "false") << "}";
            if (i + 1 < all.size()) oss << ",";
            oss << "\n";
        }
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

// ============================================================================
// Simulation
// ============================================================================

std::optional<std::string> simulate(const CompletedTransducer& machine,
                                    const std::vector<Step>& steps) {
    std::string produced;
    State state = machine.start();
    for (const auto& step : steps) {
        auto edge = machine.lookup(state, step.input);
        if (!edge) return std::nullopt;
        produced += edge->output;
        state = edge->to;
    }
    return produced;
}

std::string required_outputs(const std::vector<Step>& steps) {
    std::string out;
    for (const auto& step : steps) out += step.output;
    return out;
}

}  // namespace tracefit
