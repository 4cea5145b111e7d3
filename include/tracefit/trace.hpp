// ============================================================================
// tracefit/trace.hpp — Trace decoding
// ============================================================================
//
// A trace is written as a string of binary symbols, three per step: two
// input bits followed by the output bit the machine must emit.  Any
// character other than '0' or '1' is a separator and is dropped, so
// "001_010" and "001 010" both decode to the steps 00/1, 01/0.
//
// ============================================================================

#ifndef TRACEFIT_TRACE_HPP
#define TRACEFIT_TRACE_HPP

#include "tracefit/transducer.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracefit {

inline constexpr std::size_t kStepWidth = 3;

// ── Step ────────────────────────────────────────────────────────────────────

struct Step {
    std::size_t  index = 0;       // position in the trace
    InputSymbol  input = 0;
    OutputSymbol output = '0';    // required output
};

// ── InvalidTraceLength ──────────────────────────────────────────────────────

class InvalidTraceLength : public std::runtime_error {
public:
    explicit InvalidTraceLength(std::size_t length);

    /// Length of the trace after separator removal.
    std::size_t length() const noexcept { return length_; }

private:
    std::size_t length_;
};

/// Drop every character that is not '0' or '1'.
std::string clean_trace(const std::string& raw);

/// Clean and split a raw trace into steps.
/// Throws InvalidTraceLength if the cleaned length is not a multiple of 3.
std::vector<Step> decode_trace(const std::string& raw);

/// Render steps as "in/out" pairs separated by spaces.
std::string format_steps(const std::vector<Step>& steps);

}  // namespace tracefit

#endif  // TRACEFIT_TRACE_HPP
