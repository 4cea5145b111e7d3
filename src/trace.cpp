// ============================================================================
// trace.cpp — Trace decoding
// ============================================================================

#include "tracefit/trace.hpp"

namespace tracefit {

InvalidTraceLength::InvalidTraceLength(std::size_t length)
    : std::runtime_error("trace length " + std::to_string(length) +
                         " is not a multiple of " + std::to_string(kStepWidth)),
      length_(length) {}

std::string clean_trace(const std::string& raw) {
    std::string bits;
    bits.reserve(raw.size());
    for (char c : raw) {
        if (c == '0' || c == '1') bits += c;
    }
    return bits;
}

std::vector<Step> decode_trace(const std::string& raw) {
    const std::string bits = clean_trace(raw);
    if (bits.size() % kStepWidth != 0) {
        throw InvalidTraceLength(bits.size());
    }

    std::vector<Step> steps;
    steps.reserve(bits.size() / kStepWidth);
    for (std::size_t i = 0; i < bits.size() / kStepWidth; ++i) {
        const std::size_t at = i * kStepWidth;
        Step step;
        step.index  = i;
        step.input  = *parse_input(bits.substr(at, 2));
        step.output = bits[at + 2];
        steps.push_back(step);
    }
    return steps;
}

std::string format_steps(const std::vector<Step>& steps) {
    std::string out;
    for (const auto& step : steps) {
        if (!out.empty()) out += ' ';
        out += input_to_string(step.input);
        out += '/';
        out += step.output;
    }
    return out;
}

}  // namespace tracefit
