// ============================================================================
// ast.cpp — Implementation of truthtab AST construction and printing
// ============================================================================

#include "truthtab/ast.hpp"

#include <stdexcept>

namespace truthtab {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::True:    return "TRUE";
        case NodeKind::False:   return "FALSE";
        case NodeKind::Var:     return "Var";
        case NodeKind::Not:     return "NOT";
        case NodeKind::And:     return "AND";
        case NodeKind::Or:      return "OR";
        case NodeKind::Xor:     return "XOR";
        case NodeKind::Implies: return "->";
        case NodeKind::Equiv:   return "<->";
        case NodeKind::Nand:    return "NAND";
        case NodeKind::Nor:     return "NOR";
    }
    return "?";
}

bool is_binary(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Xor:
        case NodeKind::Implies:
        case NodeKind::Equiv:
        case NodeKind::Nand:
        case NodeKind::Nor:
            return true;
        default:
            return false;
    }
}

// ── Constructors ────────────────────────────────────────────────────────────

ExprPtr make_true() {
    auto e = std::make_unique<Expr>();
    e->kind = NodeKind::True;
    return e;
}

ExprPtr make_false() {
    auto e = std::make_unique<Expr>();
    e->kind = NodeKind::False;
    return e;
}

ExprPtr make_var(Variable v) {
    if (v < 'A' || v > 'Z') {
        throw std::invalid_argument(std::string("make_var: not a variable letter: '") + v + "'");
    }
    auto e = std::make_unique<Expr>();
    e->kind = NodeKind::Var;
    e->var = v;
    return e;
}

ExprPtr make_not(ExprPtr child) {
    auto e = std::make_unique<Expr>();
    e->kind = NodeKind::Not;
    e->children[0] = std::move(child);
    return e;
}

ExprPtr make_binary(NodeKind kind, ExprPtr lhs, ExprPtr rhs) {
    if (!is_binary(kind)) {
        throw std::invalid_argument(std::string("make_binary: ") +
                                    node_kind_name(kind) + " is not a binary connective");
    }
    auto e = std::make_unique<Expr>();
    e->kind = kind;
    e->children[0] = std::move(lhs);
    e->children[1] = std::move(rhs);
    return e;
}

// ── clone ───────────────────────────────────────────────────────────────────

ExprPtr clone(const Expr& e) {
    auto copy = std::make_unique<Expr>();
    copy->kind = e.kind;
    copy->var = e.var;
    for (int i = 0; i < 2; ++i) {
        if (e.children[i]) copy->children[i] = clone(*e.children[i]);
    }
    return copy;
}

// ── equal ───────────────────────────────────────────────────────────────────

bool equal(const Expr& a, const Expr& b) {
    if (a.kind != b.kind || a.var != b.var) return false;
    for (int i = 0; i < 2; ++i) {
        const Expr* x = a.children[i].get();
        const Expr* y = b.children[i].get();
        if ((x == nullptr) != (y == nullptr)) return false;
        if (x && !equal(*x, *y)) return false;
    }
    return true;
}

// ── variables_of ────────────────────────────────────────────────────────────

namespace {

void collect_vars(const Expr& e, bool (&seen)[26]) {
    if (e.kind == NodeKind::Var) {
        seen[e.var - 'A'] = true;
        return;
    }
    for (const auto& c : e.children) {
        if (c) collect_vars(*c, seen);
    }
}

}  // namespace

std::vector<Variable> variables_of(const Expr& e) {
    bool seen[26] = {};
    collect_vars(e, seen);
    std::vector<Variable> vars;
    for (int k = 0; k < 26; ++k) {
        if (seen[k]) vars.push_back(static_cast<Variable>('A' + k));
    }
    return vars;
}

std::size_t node_count(const Expr& e) {
    std::size_t n = 1;
    for (const auto& c : e.children) {
        if (c) n += node_count(*c);
    }
    return n;
}

// ── to_string ───────────────────────────────────────────────────────────────

std::string to_string(const Expr& e) {
    switch (e.kind) {
        case NodeKind::True:
            return "TRUE";
        case NodeKind::False:
            return "FALSE";
        case NodeKind::Var:
            return std::string(1, e.var);
        case NodeKind::Not:
            return "NOT " + to_string(*e.children[0]);
        case NodeKind::And:
            return "(" + to_string(*e.children[0]) + " AND " + to_string(*e.children[1]) + ")";
        case NodeKind::Or:
            return "(" + to_string(*e.children[0]) + " OR " + to_string(*e.children[1]) + ")";
        case NodeKind::Xor:
            return "(" + to_string(*e.children[0]) + " XOR " + to_string(*e.children[1]) + ")";
        case NodeKind::Implies:
            return "(" + to_string(*e.children[0]) + " -> " + to_string(*e.children[1]) + ")";
        case NodeKind::Equiv:
            return "(" + to_string(*e.children[0]) + " <-> " + to_string(*e.children[1]) + ")";
        case NodeKind::Nand:
            return "NAND(" + to_string(*e.children[0]) + ", " + to_string(*e.children[1]) + ")";
        case NodeKind::Nor:
            return "NOR(" + to_string(*e.children[0]) + ", " + to_string(*e.children[1]) + ")";
    }
    return "?";
}

}  // namespace truthtab
