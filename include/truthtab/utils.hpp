// ============================================================================
// truthtab/utils.hpp — Utility functions
// ============================================================================

#ifndef TRUTHTAB_UTILS_HPP
#define TRUTHTAB_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace truthtab {

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

/// Split on every occurrence of `sep`.  Empty fields are kept, so
/// "a,,b" gives three fields.
std::vector<std::string> split(std::string_view s, char sep);

}  // namespace truthtab

#endif  // TRUTHTAB_UTILS_HPP
