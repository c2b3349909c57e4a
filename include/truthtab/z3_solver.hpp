// ============================================================================
// truthtab/z3_solver.hpp — Z3 wrapper for propositional queries
// ============================================================================
//
// This module encodes a formula tree into Z3 boolean terms and answers
// satisfiability, validity and equivalence queries.  It works independently
// of truth-table enumeration, so it serves as a cross-check of generated
// tables and of the DNF / CNF strings built from them.
//
// Usage:
//   Z3Checker checker;
//   if (checker.are_equivalent(formula, *parse(dnf))) { ... }
//
// Every query runs inside its own solver scope; a checker can be reused.
//
// ============================================================================

#ifndef TRUTHTAB_Z3_SOLVER_HPP
#define TRUTHTAB_Z3_SOLVER_HPP

#include "truthtab/ast.hpp"

#include <z3++.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace truthtab {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

// ── Z3Checker ───────────────────────────────────────────────────────────────
// Maintains a Z3 context and solver.  Variables are created lazily as Z3
// boolean constants named after their letter.

class Z3Checker {
public:
    Z3Checker();

    /// Satisfiability of `e` alone.
    Z3Result check(const Expr& e);

    /// True iff some assignment makes `e` true.  Throws std::runtime_error
    /// if Z3 answers unknown.
    bool is_satisfiable(const Expr& e);

    /// True iff every assignment makes `e` true.
    bool is_valid(const Expr& e);

    /// True iff `a` and `b` agree on every assignment.
    bool are_equivalent(const Expr& a, const Expr& b);

    /// Variable valuation from the last SAT answer of check() or
    /// is_satisfiable(), e.g. "{A = true, B = false}".
    const std::string& model() const noexcept { return model_; }

    /// Drop all cached variables and the stored model.
    void reset();

private:
    // Convert a formula tree to a Z3 boolean expression.
    z3::expr to_z3(const Expr& e);

    // Get or create a Z3 boolean variable for the given letter.
    z3::expr get_bool_var(Variable v);

    // Run `query` in a fresh scope.  On SAT, store the values of `report`
    // as the model.
    Z3Result check_scoped(const z3::expr& query, const std::vector<Variable>& report);

    bool decided(Z3Result r, const char* what) const;

    z3::context ctx_;
    z3::solver  solver_;

    // Map from variable letter to Z3 boolean constant.
    std::map<Variable, std::unique_ptr<z3::expr>> bool_vars_;

    std::string model_;
};

}  // namespace truthtab

#endif  // TRUTHTAB_Z3_SOLVER_HPP
