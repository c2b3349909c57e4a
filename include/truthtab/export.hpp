// ============================================================================
// truthtab/export.hpp — Flat row export and import of truth tables
// ============================================================================
//
// Layout (CSV):
//
//   A,B,Result
//   0,0,0
//   0,1,0
//   1,0,0
//   1,1,1
//
// The header lists the variables in table order followed by "Result"; each
// following line is one row of 0/1 cells.  to_tsv() produces the same
// layout with tab separators.  from_csv(to_csv(t)) == t.
//
// ============================================================================

#ifndef TRUTHTAB_EXPORT_HPP
#define TRUTHTAB_EXPORT_HPP

#include "truthtab/truth_table.hpp"

#include <string>
#include <string_view>

namespace truthtab {

/// Comma-separated rendering with header line.
std::string to_csv(const TruthTable& table);

/// Tab-separated rendering with header line.
std::string to_tsv(const TruthTable& table);

/// Parse the CSV layout back into a table.  Blank lines and '\r' line
/// endings are tolerated.  Throws std::runtime_error naming the offending
/// line on a malformed header, wrong cell count, a cell other than 0/1,
/// or a row out of binary counting order (row i must assign the bits of i,
/// first variable most significant).
TruthTable from_csv(std::string_view text);

/// Write to_csv(table) to `path`.  Throws std::runtime_error if the file
/// cannot be written.
void write_csv(const std::string& path, const TruthTable& table);

}  // namespace truthtab

#endif  // TRUTHTAB_EXPORT_HPP
