// ============================================================================
// normal_form.cpp — DNF / CNF construction
// ============================================================================

#include "truthtab/normal_form.hpp"

#include <stdexcept>

namespace truthtab {

namespace {

void check_arity(const std::vector<Variable>& variables, const TruthTableRow& row) {
    if (row.values.size() != variables.size()) {
        throw std::invalid_argument(
            "row has " + std::to_string(row.values.size()) + " values for " +
            std::to_string(variables.size()) + " variables");
    }
}

// Join `terms` with `sep`, wrapped in parentheses.
std::string clause(const std::vector<std::string>& terms, const char* sep) {
    std::string out = "(";
    for (std::size_t i = 0; i < terms.size(); ++i) {
        if (i > 0) out += sep;
        out += terms[i];
    }
    out += ")";
    return out;
}

std::string literal(Variable v, bool positive) {
    return positive ? std::string(1, v) : std::string("not ") + v;
}

}  // namespace

// ── build_dnf ───────────────────────────────────────────────────────────────

std::string build_dnf(const std::vector<Variable>& variables, const TruthTable& table) {
    std::string out;
    for (const auto& row : table.rows) {
        check_arity(variables, row);
        if (!row.result) continue;

        // A true row over zero variables is the whole (constant) function.
        if (variables.empty()) return "True";

        std::vector<std::string> terms;
        for (std::size_t i = 0; i < variables.size(); ++i) {
            terms.push_back(literal(variables[i], row.values[i]));
        }
        if (!out.empty()) out += " or ";
        out += clause(terms, " and ");
    }
    return out.empty() ? "False" : out;
}

// ── build_cnf ───────────────────────────────────────────────────────────────

std::string build_cnf(const std::vector<Variable>& variables, const TruthTable& table) {
    std::string out;
    for (const auto& row : table.rows) {
        check_arity(variables, row);
        if (row.result) continue;

        // The empty clause.
        if (variables.empty()) return "False";

        std::vector<std::string> terms;
        for (std::size_t i = 0; i < variables.size(); ++i) {
            terms.push_back(literal(variables[i], !row.values[i]));
        }
        if (!out.empty()) out += " and ";
        out += clause(terms, " or ");
    }
    return out.empty() ? "True" : out;
}

}  // namespace truthtab
