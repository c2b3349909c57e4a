// ============================================================================
// evaluator.cpp — Recursive formula evaluation
// ============================================================================

#include "truthtab/evaluator.hpp"

namespace truthtab {

// ── make_assignment ─────────────────────────────────────────────────────────

Assignment make_assignment(const std::vector<Variable>& vars,
                           const std::vector<bool>& values) {
    if (vars.size() != values.size()) {
        throw std::invalid_argument(
            "make_assignment: " + std::to_string(vars.size()) + " variables but " +
            std::to_string(values.size()) + " values");
    }
    Assignment a;
    for (std::size_t i = 0; i < vars.size(); ++i) {
        a[vars[i]] = values[i];
    }
    return a;
}

// ── EvaluationError ─────────────────────────────────────────────────────────

EvaluationError::EvaluationError(Variable missing)
    : std::runtime_error(std::string("no value assigned to variable '") +
                         missing + "'"),
      var_(missing) {}

// ── evaluate ────────────────────────────────────────────────────────────────

bool evaluate(const Expr& e, const Assignment& a) {
    switch (e.kind) {
        case NodeKind::True:
            return true;

        case NodeKind::False:
            return false;

        case NodeKind::Var: {
            auto it = a.find(e.var);
            if (it == a.end()) {
                throw EvaluationError(e.var);
            }
            return it->second;
        }

        case NodeKind::Not:
            return !evaluate(*e.children[0], a);

        default:
            break;
    }

    // No short-circuit: a missing variable on either side is always reported.
    bool lhs = evaluate(*e.children[0], a);
    bool rhs = evaluate(*e.children[1], a);

    switch (e.kind) {
        case NodeKind::And:     return lhs && rhs;
        case NodeKind::Or:      return lhs || rhs;
        case NodeKind::Xor:     return lhs != rhs;
        case NodeKind::Implies: return !lhs || rhs;
        case NodeKind::Equiv:   return lhs == rhs;
        case NodeKind::Nand:    return !(lhs && rhs);
        case NodeKind::Nor:     return !(lhs || rhs);
        default:
            break;
    }

    throw std::logic_error(std::string("evaluate: unhandled node kind ") +
                           node_kind_name(e.kind));
}

}  // namespace truthtab
