// ============================================================================
// tracefit/utils.hpp — Utility functions
// ============================================================================

#ifndef TRACEFIT_UTILS_HPP
#define TRACEFIT_UTILS_HPP

#include <string>
#include <vector>

namespace tracefit {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Split a line on runs of whitespace.  Empty fields are never produced.
std::vector<std::string> split_fields(const std::string& line);

/// True if every character of `s` is '0' or '1' (and `s` is non-empty).
bool is_binary(const std::string& s);

}  // namespace tracefit

#endif  // TRACEFIT_UTILS_HPP
