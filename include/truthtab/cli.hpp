// ============================================================================
// truthtab/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: read formulas → parse → generate table → print the table
// and whatever derived views were requested.
//
// The driver holds the current formula and table for each input line;
// nothing is kept between lines.
//
// ============================================================================

#ifndef TRUTHTAB_CLI_HPP
#define TRUTHTAB_CLI_HPP

#include <ostream>
#include <string>
#include <vector>

namespace truthtab {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string input;        // formula, or path ending in .txt (empty if --selftest)
    std::string csv_path;     // --csv <path>; empty = no export
    std::string equiv_with;   // --equiv <formula>; empty = no comparison
    bool        selftest = false;
    bool        help = false;
    bool        show_dnf = false;
    bool        show_cnf = false;
    bool        show_kmap = false;
    bool        show_checks = false;  // tautology / contradiction report
    bool        tsv = false;          // tab-separated table output
    bool        verify = false;       // Z3 equivalence of DNF / CNF with the formula
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to `out` (stdout for --help, stderr after a
/// usage error).
void print_usage(std::ostream& out, const std::string& program_name);

/// CSV path for input line `line` when a file holds several formulas:
/// "out.csv" → "out_3.csv".
std::string csv_path_for_line(const std::string& path, unsigned line);

/// Main driver: read input, process formulas, print results.
/// Returns the process exit code (0 = ok, 1 = errors encountered).
int run(const Options& opts);

}  // namespace truthtab

#endif  // TRUTHTAB_CLI_HPP
