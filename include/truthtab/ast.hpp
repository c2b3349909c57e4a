// ============================================================================
// truthtab/ast.hpp — Abstract Syntax Tree for propositional formulas
// ============================================================================
//
// Design notes:
//
//   A formula is a tree of Expr nodes.  Each node exclusively owns its
//   operands through std::unique_ptr, so a tree is moved, never shared.
//
//   Node types:
//     - Var       : propositional variable (single letter)
//     - True/False: boolean constants
//     - Not       : negation, child[0]
//     - And       : conjunction,  child[0] AND child[1]
//     - Or        : disjunction,  child[0] OR child[1]
//     - Xor       : exclusive or, child[0] XOR child[1]
//     - Implies   : implication,  child[0] -> child[1]
//     - Equiv     : equivalence,  child[0] <-> child[1]
//     - Nand      : NAND(child[0], child[1])
//     - Nor       : NOR(child[0], child[1])
//
// ============================================================================

#ifndef TRUTHTAB_AST_HPP
#define TRUTHTAB_AST_HPP

#include "truthtab/lexer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace truthtab {

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    // Constants
    True,
    False,

    // Atoms
    Var,

    // Connectives
    Not,
    And,
    Or,
    Xor,
    Implies,
    Equiv,
    Nand,
    Nor
};

/// Human-readable string for a NodeKind.
const char* node_kind_name(NodeKind k) noexcept;

/// True for the two-operand kinds.
bool is_binary(NodeKind k) noexcept;

// ── Expr ────────────────────────────────────────────────────────────────────

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Expr {
    NodeKind kind{};
    Variable var = 0;       // set for Var nodes
    ExprPtr  children[2];   // child[0] for Not, both for binary kinds
};

// ── Constructors ────────────────────────────────────────────────────────────

ExprPtr make_true();
ExprPtr make_false();
ExprPtr make_var(Variable v);
ExprPtr make_not(ExprPtr child);
ExprPtr make_binary(NodeKind kind, ExprPtr lhs, ExprPtr rhs);

inline ExprPtr make_and(ExprPtr l, ExprPtr r)     { return make_binary(NodeKind::And, std::move(l), std::move(r)); }
inline ExprPtr make_or(ExprPtr l, ExprPtr r)      { return make_binary(NodeKind::Or, std::move(l), std::move(r)); }
inline ExprPtr make_xor(ExprPtr l, ExprPtr r)     { return make_binary(NodeKind::Xor, std::move(l), std::move(r)); }
inline ExprPtr make_implies(ExprPtr l, ExprPtr r) { return make_binary(NodeKind::Implies, std::move(l), std::move(r)); }
inline ExprPtr make_equiv(ExprPtr l, ExprPtr r)   { return make_binary(NodeKind::Equiv, std::move(l), std::move(r)); }
inline ExprPtr make_nand(ExprPtr l, ExprPtr r)    { return make_binary(NodeKind::Nand, std::move(l), std::move(r)); }
inline ExprPtr make_nor(ExprPtr l, ExprPtr r)     { return make_binary(NodeKind::Nor, std::move(l), std::move(r)); }

// ── Queries ─────────────────────────────────────────────────────────────────

/// Deep copy of a tree.
ExprPtr clone(const Expr& e);

/// Structural equality.
bool equal(const Expr& a, const Expr& b);

/// Sorted, de-duplicated variables referenced by the tree.
std::vector<Variable> variables_of(const Expr& e);

/// Number of nodes in the tree.
std::size_t node_count(const Expr& e);

// ── Pretty-print ────────────────────────────────────────────────────────────
// Returns a fully parenthesised string that parses back to an equal tree,
// e.g. "((A AND B) -> NAND(C, NOT D))".

std::string to_string(const Expr& e);

}  // namespace truthtab

#endif  // TRUTHTAB_AST_HPP
