// ============================================================================
// truthtab/normal_form.hpp — Canonical DNF / CNF from a truth table
// ============================================================================
//
// Both forms are read straight off an already generated table; the formula
// is never re-evaluated.
//
//   DNF  one minterm per true row, e.g.  (not A and B) or (A and B)
//        no true row            →  False
//
//   CNF  one maxterm per false row, e.g. (A or B) and (A or not B)
//        no false row           →  True
//
// A maxterm excludes exactly its row: a variable that is true in the row
// appears negated.
//
// The strings are valid parser input, so they can be parsed and evaluated
// again to check them against the table.
//
// ============================================================================

#ifndef TRUTHTAB_NORMAL_FORM_HPP
#define TRUTHTAB_NORMAL_FORM_HPP

#include "truthtab/truth_table.hpp"

#include <string>
#include <vector>

namespace truthtab {

/// Canonical disjunctive normal form of `table`.
/// Throws std::invalid_argument if a row's arity differs from `variables`.
std::string build_dnf(const std::vector<Variable>& variables, const TruthTable& table);

/// Canonical conjunctive normal form of `table`.
/// Throws std::invalid_argument if a row's arity differs from `variables`.
std::string build_cnf(const std::vector<Variable>& variables, const TruthTable& table);

}  // namespace truthtab

#endif  // TRUTHTAB_NORMAL_FORM_HPP
