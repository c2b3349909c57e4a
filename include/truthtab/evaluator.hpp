// ============================================================================
// truthtab/evaluator.hpp — Evaluation of a formula under one assignment
// ============================================================================
//
// evaluate() walks the tree recursively:
//
//   NOT a        = !a
//   a AND b      = a && b
//   a OR b       = a || b
//   a XOR b      = a != b
//   a -> b       = !a || b
//   a <-> b      = a == b
//   NAND(a, b)   = !(a && b)
//   NOR(a, b)    = !(a || b)
//
// Evaluation is pure: the same tree and assignment always give the same
// result.
//
// ============================================================================

#ifndef TRUTHTAB_EVALUATOR_HPP
#define TRUTHTAB_EVALUATOR_HPP

#include "truthtab/ast.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace truthtab {

// ── Assignment ──────────────────────────────────────────────────────────────
// One boolean value per variable.

using Assignment = std::map<Variable, bool>;

/// Zip a variable list with a value list of the same length.
/// Throws std::invalid_argument on a length mismatch.
Assignment make_assignment(const std::vector<Variable>& vars,
                           const std::vector<bool>& values);

// ── EvaluationError ─────────────────────────────────────────────────────────
// Thrown when the assignment has no value for a variable used by the tree.

class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(Variable missing);

    Variable variable() const noexcept { return var_; }

private:
    Variable var_;
};

// ── evaluate ────────────────────────────────────────────────────────────────

bool evaluate(const Expr& expr, const Assignment& assignment);

}  // namespace truthtab

#endif  // TRUTHTAB_EVALUATOR_HPP
