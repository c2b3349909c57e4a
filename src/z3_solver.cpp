// ============================================================================
// z3_solver.cpp — Implementation of the Z3 propositional checker
// ============================================================================

#include "truthtab/z3_solver.hpp"

#include <stdexcept>

namespace truthtab {

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker()
    : ctx_(), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    bool_vars_.clear();
    model_.clear();
}

z3::expr Z3Checker::get_bool_var(Variable v) {
    auto it = bool_vars_.find(v);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    const char name[2] = {v, '\0'};
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name));
    z3::expr result = *var;
    bool_vars_[v] = std::move(var);
    return result;
}

z3::expr Z3Checker::to_z3(const Expr& e) {
    switch (e.kind) {
        case NodeKind::True:
            return ctx_.bool_val(true);
        case NodeKind::False:
            return ctx_.bool_val(false);

        case NodeKind::Var:
            return get_bool_var(e.var);

        case NodeKind::Not:
            return !to_z3(*e.children[0]);

        case NodeKind::And:
            return to_z3(*e.children[0]) && to_z3(*e.children[1]);

        case NodeKind::Or:
            return to_z3(*e.children[0]) || to_z3(*e.children[1]);

        case NodeKind::Xor:
            return to_z3(*e.children[0]) != to_z3(*e.children[1]);

        case NodeKind::Implies:
            return z3::implies(to_z3(*e.children[0]), to_z3(*e.children[1]));

        case NodeKind::Equiv:
            return to_z3(*e.children[0]) == to_z3(*e.children[1]);

        case NodeKind::Nand:
            return !(to_z3(*e.children[0]) && to_z3(*e.children[1]));

        case NodeKind::Nor:
            return !(to_z3(*e.children[0]) || to_z3(*e.children[1]));
    }

    throw std::runtime_error(std::string("to_z3: unhandled node kind ") +
                             node_kind_name(e.kind));
}

Z3Result Z3Checker::check_scoped(const z3::expr& query, const std::vector<Variable>& report) {
    solver_.push();
    solver_.add(query);
    z3::check_result result = solver_.check();

    Z3Result r = Z3Result::UNKNOWN;
    switch (result) {
        case z3::sat:     r = Z3Result::SAT; break;
        case z3::unsat:   r = Z3Result::UNSAT; break;
        case z3::unknown: r = Z3Result::UNKNOWN; break;
    }

    if (!report.empty() && r == Z3Result::SAT) {
        z3::model m = solver_.get_model();
        std::string text = "{";
        for (std::size_t i = 0; i < report.size(); ++i) {
            if (i > 0) text += ", ";
            z3::expr value = m.eval(get_bool_var(report[i]), true);
            text += std::string(1, report[i]) + " = " + value.to_string();
        }
        text += "}";
        model_ = std::move(text);
    }

    solver_.pop();
    return r;
}

bool Z3Checker::decided(Z3Result r, const char* what) const {
    if (r == Z3Result::UNKNOWN) {
        throw std::runtime_error(std::string(what) + ": Z3 returned unknown");
    }
    return r == Z3Result::SAT;
}

// ── Queries ─────────────────────────────────────────────────────────────────

Z3Result Z3Checker::check(const Expr& e) {
    z3::expr q = to_z3(e);
    std::vector<Variable> vars = variables_of(e);
    if (vars.empty()) model_ = "{}";
    return check_scoped(q, vars);
}

bool Z3Checker::is_satisfiable(const Expr& e) {
    return decided(check(e), "is_satisfiable");
}

bool Z3Checker::is_valid(const Expr& e) {
    z3::expr q = !to_z3(e);
    return !decided(check_scoped(q, {}), "is_valid");
}

bool Z3Checker::are_equivalent(const Expr& a, const Expr& b) {
    z3::expr q = to_z3(a) != to_z3(b);
    return !decided(check_scoped(q, {}), "are_equivalent");
}

}  // namespace truthtab
