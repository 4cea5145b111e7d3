// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "tracefit/utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tracefit {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    return trim(line.substr(0, line.find('#')));
}

// ── split_fields ────────────────────────────────────────────────────────────

std::vector<std::string> split_fields(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

// ── is_binary ───────────────────────────────────────────────────────────────

bool is_binary(const std::string& s) {
    if (s.empty()) return false;
    return s.find_first_not_of("01") == std::string::npos;
}

}  // namespace tracefit
