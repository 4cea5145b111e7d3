// ============================================================================
// transducer.cpp — Predefined transducer table and model file loader
// ============================================================================

#include "tracefit/transducer.hpp"
#include "tracefit/utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace tracefit {

// ============================================================================
// Symbols
// ============================================================================

std::optional<InputSymbol> parse_input(const std::string& text) {
    if (text.size() != 2 || !is_binary(text)) return std::nullopt;
    return static_cast<InputSymbol>(((text[0] - '0') << 1) | (text[1] - '0'));
}

std::string input_to_string(InputSymbol in) {
    std::string s(2, '0');
    s[0] = (in & 0x2) ? '1' : '0';
    s[1] = (in & 0x1) ? '1' : '0';
    return s;
}

// ============================================================================
// ModelError
// ============================================================================

static std::string model_error_message(std::uint32_t line, const std::string& msg) {
    if (line == 0) return "model: " + msg;
    return "model line " + std::to_string(line) + ": " + msg;
}

ModelError::ModelError(std::uint32_t line, const std::string& msg)
    : std::runtime_error(model_error_message(line, msg)), line_(line) {}

// ============================================================================
// TransducerModel
// ============================================================================

// Names of the form N<digits> are what synthesized states print as.
static bool is_reserved_name(const std::string& name) {
    if (name.size() < 2 || name[0] != 'N') return false;
    return std::all_of(name.begin() + 1, name.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

TransducerModel::TransducerModel(const std::vector<NamedTransition>& table) {
    if (table.empty()) {
        throw ModelError(0, "model defines no transitions");
    }

    std::set<std::string> names;
    for (const auto& t : table) {
        for (const std::string* name : {&t.from, &t.to}) {
            if (is_reserved_name(*name)) {
                throw ModelError(t.line, "state name '" + *name +
                                 "' is reserved for synthesized states");
            }
            names.insert(*name);
        }
    }

    names_.assign(names.begin(), names.end());
    table_.resize(names_.size());
    for (std::uint32_t i = 0; i < names_.size(); ++i) {
        states_.push_back(State::predefined(i));
    }

    for (const auto& t : table) {
        if (t.input >= kInputAlphabetSize) {
            throw ModelError(t.line, "input symbol out of range");
        }
        if (t.output != '0' && t.output != '1') {
            throw ModelError(t.line, "output symbol must be 0 or 1");
        }
        State from = *find_state(t.from);
        State to   = *find_state(t.to);
        auto& slot = table_[from.index][t.input];
        if (slot) {
            throw ModelError(t.line, "duplicate transition for " + t.from +
                             " on " + input_to_string(t.input));
        }
        slot = Edge{to, t.output};
    }
}

TransducerModel TransducerModel::builtin() {
    return TransducerModel(std::vector<NamedTransition>{
        {"S0", 0b01, "S1", '1'},
        {"S0", 0b11, "S1", '0'},
        {"S0", 0b10, "S2", '0'},
        {"S1", 0b01, "S3", '1'},
        {"S2", 0b00, "S3", '1'},
        {"S2", 0b11, "S1", '0'},
        {"S2", 0b10, "S3", '0'},
        {"S3", 0b01, "S0", '1'},
    });
}

std::optional<Edge> TransducerModel::lookup(State state, InputSymbol input) const {
    if (state.is_synthesized() || state.index >= table_.size() ||
        input >= kInputAlphabetSize) {
        return std::nullopt;
    }
    return table_[state.index][input];
}

std::vector<Transition> TransducerModel::transitions() const {
    std::vector<Transition> out;
    for (std::uint32_t i = 0; i < table_.size(); ++i) {
        for (InputSymbol in = 0; in < kInputAlphabetSize; ++in) {
            const auto& edge = table_[i][in];
            if (edge) {
                out.push_back(Transition{State::predefined(i), in, edge->to, edge->output});
            }
        }
    }
    return out;
}

std::string TransducerModel::name_of(State state) const {
    if (state.is_synthesized()) {
        return "N" + std::to_string(state.index);
    }
    if (state.index < names_.size()) {
        return names_[state.index];
    }
    return "?" + std::to_string(state.index);
}

std::optional<State> TransducerModel::find_state(const std::string& name) const {
    auto it = std::lower_bound(names_.begin(), names_.end(), name);
    if (it == names_.end() || *it != name) return std::nullopt;
    return State::predefined(static_cast<std::uint32_t>(it - names_.begin()));
}

// ============================================================================
// Model loading
// ============================================================================

TransducerModel parse_model(const std::vector<std::string>& lines) {
    std::vector<TransducerModel::NamedTransition> table;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::uint32_t line_num = static_cast<std::uint32_t>(i + 1);
        std::string content = strip_comment(lines[i]);
        if (content.empty()) continue;

        std::vector<std::string> fields = split_fields(content);
        if (fields.size() != 4) {
            throw ModelError(line_num, "expected 'FROM INPUT TO OUTPUT', got " +
                             std::to_string(fields.size()) + " field(s)");
        }

        auto input = parse_input(fields[1]);
        if (!input) {
            throw ModelError(line_num, "input '" + fields[1] +
                             "' is not a two-symbol binary word");
        }
        if (fields[3] != "0" && fields[3] != "1") {
            throw ModelError(line_num, "output '" + fields[3] + "' must be 0 or 1");
        }

        table.push_back({fields[0], *input, fields[2], fields[3][0], line_num});
    }

    return TransducerModel(table);
}

TransducerModel load_model(const std::string& path) {
    return parse_model(read_lines(path));
}

}  // namespace tracefit
