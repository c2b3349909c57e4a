// ============================================================================
// truth_table.cpp — Truth-table enumeration and predicates
// ============================================================================

#include "truthtab/truth_table.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace truthtab {

// ── row_values ──────────────────────────────────────────────────────────────

std::vector<bool> row_values(std::size_t index, std::size_t n) {
    std::vector<bool> values(n);
    for (std::size_t j = 0; j < n; ++j) {
        values[j] = ((index >> (n - 1 - j)) & 1u) != 0;
    }
    return values;
}

// ── generate_table ──────────────────────────────────────────────────────────

TruthTable generate_table(const std::vector<Variable>& variables, const Expr& expr) {
    const std::size_t n = variables.size();
    if (n > kMaxVariables) {
        throw std::length_error(
            "generate_table: " + std::to_string(n) + " variables exceeds the limit of " +
            std::to_string(kMaxVariables));
    }
    if (std::adjacent_find(variables.begin(), variables.end(),
                           [](Variable a, Variable b) { return a >= b; }) != variables.end()) {
        throw std::invalid_argument("generate_table: variables must be sorted and distinct");
    }

    TruthTable table;
    table.variables = variables;

    const std::size_t count = std::size_t{1} << n;
    table.rows.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        TruthTableRow row;
        row.values = row_values(i, n);
        row.result = evaluate(expr, make_assignment(variables, row.values));
        table.rows.push_back(std::move(row));
    }
    return table;
}

// ── Predicates ──────────────────────────────────────────────────────────────

bool is_tautology(const TruthTable& table) noexcept {
    return std::all_of(table.rows.begin(), table.rows.end(),
                       [](const TruthTableRow& r) { return r.result; });
}

bool is_contradiction(const TruthTable& table) noexcept {
    return std::none_of(table.rows.begin(), table.rows.end(),
                        [](const TruthTableRow& r) { return r.result; });
}

bool is_satisfiable(const TruthTable& table) noexcept {
    return !is_contradiction(table);
}

std::size_t true_count(const TruthTable& table) noexcept {
    return static_cast<std::size_t>(
        std::count_if(table.rows.begin(), table.rows.end(),
                      [](const TruthTableRow& r) { return r.result; }));
}

// ── format_table ────────────────────────────────────────────────────────────

std::string format_table(const TruthTable& table) {
    std::ostringstream out;
    for (Variable v : table.variables) out << v << ' ';
    out << (table.variables.empty() ? "" : "| ") << "Result\n";

    for (const auto& row : table.rows) {
        for (bool b : row.values) out << (b ? '1' : '0') << ' ';
        out << (table.variables.empty() ? "" : "| ") << (row.result ? '1' : '0') << '\n';
    }
    return out.str();
}

}  // namespace truthtab
