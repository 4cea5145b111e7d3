// ============================================================================
// tracefit/transducer.hpp — Predefined transducer table
// ============================================================================
//
// Design notes:
//
//   A transducer reads one two-bit input symbol per step, emits a one-bit
//   output and moves to a destination state.  The TransducerModel holds the
//   fixed, predefined part of the machine: the transitions that exist before
//   any search begins.  It is immutable after construction and is shared
//   read-only by every search.
//
//   States are small value handles.  Predefined states are numbered by the
//   sorted order of their names; synthesized states carry a 1-based tag that
//   is assigned by a single search and has no meaning outside of it.
//
//   Model file format (one transition per line):
//
//       # from  input  to  output
//       S0      01     S1  1
//
// ============================================================================

#ifndef TRACEFIT_TRANSDUCER_HPP
#define TRACEFIT_TRANSDUCER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracefit {

// ── Symbols ─────────────────────────────────────────────────────────────────
// An input symbol is a two-bit word stored as its numeric code
// ("00" = 0, "01" = 1, "10" = 2, "11" = 3).  An output symbol is the
// character '0' or '1'.

using InputSymbol  = std::uint8_t;
using OutputSymbol = char;

inline constexpr std::size_t kInputAlphabetSize = 4;

/// Parse a two-character binary word.  Returns nullopt if malformed.
std::optional<InputSymbol> parse_input(const std::string& text);

/// Render an input symbol as its two-character binary word.
std::string input_to_string(InputSymbol in);

// ── State ───────────────────────────────────────────────────────────────────

struct State {
    enum class Kind : std::uint8_t { Predefined, Synthesized };

    Kind          kind  = Kind::Predefined;
    std::uint32_t index = 0;   // model index, or synthesized tag (1-based)

    static State predefined(std::uint32_t i) { return State{Kind::Predefined, i}; }
    static State synthesized(std::uint32_t tag) { return State{Kind::Synthesized, tag}; }

    bool is_synthesized() const noexcept { return kind == Kind::Synthesized; }

    bool operator==(const State& o) const noexcept {
        return kind == o.kind && index == o.index;
    }
    bool operator!=(const State& o) const noexcept { return !(*this == o); }

    // Predefined states order before synthesized ones; this order is also
    // the tie-break order of the search.
    bool operator<(const State& o) const noexcept {
        if (kind != o.kind) return kind == Kind::Predefined;
        return index < o.index;
    }
};

struct StateHash {
    std::size_t operator()(const State& s) const noexcept {
        return std::hash<std::uint64_t>{}(
            (static_cast<std::uint64_t>(s.kind) << 32) | s.index);
    }
};

// ── Edge / Transition ───────────────────────────────────────────────────────

/// Right-hand side of a transition: where it goes and what it emits.
struct Edge {
    State        to;
    OutputSymbol output = '0';

    bool operator==(const Edge& o) const noexcept {
        return to == o.to && output == o.output;
    }
};

struct Transition {
    State        from;
    InputSymbol  input = 0;
    State        to;
    OutputSymbol output = '0';
};

// ── ModelError ──────────────────────────────────────────────────────────────
// Raised while loading a model file.  `line()` is 1-based, 0 if the error
// is not tied to a particular line.

class ModelError : public std::runtime_error {
public:
    ModelError(std::uint32_t line, const std::string& msg);

    std::uint32_t line() const noexcept { return line_; }

private:
    std::uint32_t line_;
};

// ── TransducerModel ─────────────────────────────────────────────────────────

class TransducerModel {
public:
    /// Build a model from a list of named transitions
    /// (from, input, to, output).  Throws ModelError on duplicates or
    /// reserved names.
    struct NamedTransition {
        std::string  from;
        InputSymbol  input = 0;
        std::string  to;
        OutputSymbol output = '0';
        std::uint32_t line = 0;
    };
    explicit TransducerModel(const std::vector<NamedTransition>& table);

    /// The four-state table the tool ships with.
    static TransducerModel builtin();

    /// Predefined transition for (state, input), if any.  Synthesized
    /// states never have predefined transitions.
    std::optional<Edge> lookup(State state, InputSymbol input) const;

    /// Predefined states in index order.
    const std::vector<State>& states() const noexcept { return states_; }

    /// All predefined transitions, ordered by (source, input).
    std::vector<Transition> transitions() const;

    /// Display name: the model name for predefined states, "N<tag>" for
    /// synthesized ones.
    std::string name_of(State state) const;

    /// Predefined state with the given name.
    std::optional<State> find_state(const std::string& name) const;

    std::size_t num_states() const noexcept { return states_.size(); }

private:
    using Row = std::array<std::optional<Edge>, kInputAlphabetSize>;

    std::vector<std::string> names_;   // index → name (sorted)
    std::vector<State>       states_;
    std::vector<Row>         table_;   // index → input → edge
};

// ── Model loading ───────────────────────────────────────────────────────────

/// Parse model lines (comments and blank lines are skipped).
/// Throws ModelError on malformed input.
TransducerModel parse_model(const std::vector<std::string>& lines);

/// Read and parse a model file.  Throws std::runtime_error if the file
/// cannot be read and ModelError if its content is malformed.
TransducerModel load_model(const std::string& path);

}  // namespace tracefit

#endif  // TRACEFIT_TRANSDUCER_HPP
