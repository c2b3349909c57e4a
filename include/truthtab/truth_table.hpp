// ============================================================================
// truthtab/truth_table.hpp — Exhaustive truth-table generation
// ============================================================================
//
// A TruthTable for n variables has exactly 2^n rows.  Row i assigns the
// binary digits of i to the variables, the first variable being the most
// significant bit:
//
//     A B | result          row 0:  A=0 B=0
//     ----+-------          row 1:  A=0 B=1
//     0 0 |  f(0,0)         row 2:  A=1 B=0
//     0 1 |  f(0,1)         row 3:  A=1 B=1
//     ...
//
// A table over zero variables has a single row holding only the result.
//
// ============================================================================

#ifndef TRUTHTAB_TRUTH_TABLE_HPP
#define TRUTHTAB_TRUTH_TABLE_HPP

#include "truthtab/ast.hpp"
#include "truthtab/evaluator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace truthtab {

/// Largest variable count generate_table() accepts.
inline constexpr std::size_t kMaxVariables = 20;

// ── TruthTableRow ───────────────────────────────────────────────────────────

struct TruthTableRow {
    std::vector<bool> values;   // one per variable, table order
    bool              result = false;

    bool operator==(const TruthTableRow& o) const noexcept {
        return values == o.values && result == o.result;
    }
};

// ── TruthTable ──────────────────────────────────────────────────────────────

struct TruthTable {
    std::vector<Variable>      variables;
    std::vector<TruthTableRow> rows;

    std::size_t size() const noexcept { return rows.size(); }

    bool operator==(const TruthTable& o) const noexcept {
        return variables == o.variables && rows == o.rows;
    }
};

/// The values of row `index` in a table over `n` variables.
std::vector<bool> row_values(std::size_t index, std::size_t n);

/// Evaluate `expr` once per assignment of `variables`.
/// Throws EvaluationError if `expr` uses a variable not in `variables`,
/// std::length_error if there are more than kMaxVariables, and
/// std::invalid_argument if `variables` is unsorted or repeats a letter.
TruthTable generate_table(const std::vector<Variable>& variables, const Expr& expr);

// ── Predicates ──────────────────────────────────────────────────────────────

/// Every row true.
bool is_tautology(const TruthTable& table) noexcept;

/// Every row false.
bool is_contradiction(const TruthTable& table) noexcept;

/// At least one row true.
bool is_satisfiable(const TruthTable& table) noexcept;

/// Number of true rows.
std::size_t true_count(const TruthTable& table) noexcept;

// ── Display ─────────────────────────────────────────────────────────────────
// Aligned text rendering, e.g.
//   A B | Result
//   0 0 | 0

std::string format_table(const TruthTable& table);

}  // namespace truthtab

#endif  // TRUTHTAB_TRUTH_TABLE_HPP
