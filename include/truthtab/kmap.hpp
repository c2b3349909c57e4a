// ============================================================================
// truthtab/kmap.hpp — Karnaugh maps for 2–4 variable functions
// ============================================================================
//
// build_kmap() indexes a truth table by assignment tuple.  It is defined
// for 2, 3 and 4 variables only; for any other count it returns an empty
// optional, which is an ordinary outcome and not an error.
//
// layout() gives one conventional grid arrangement for display: the first
// n/2 variables index the rows, the rest the columns, and each axis is
// walked in Gray-code order so that neighbouring cells differ in exactly
// one variable.
//
//   n = 3:   A\BC | 00 01 11 10
//            -----+------------
//               0 |  .  .  .  .
//               1 |  .  .  .  .
//
// ============================================================================

#ifndef TRUTHTAB_KMAP_HPP
#define TRUTHTAB_KMAP_HPP

#include "truthtab/truth_table.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace truthtab {

inline constexpr std::size_t kKmapMinVariables = 2;
inline constexpr std::size_t kKmapMaxVariables = 4;

// ── KmapLayout ──────────────────────────────────────────────────────────────

struct KmapLayout {
    std::vector<Variable>          row_vars;
    std::vector<Variable>          col_vars;
    std::vector<std::vector<bool>> row_keys;   // Gray-code order
    std::vector<std::vector<bool>> col_keys;   // Gray-code order
};

// ── KarnaughMap ─────────────────────────────────────────────────────────────

class KarnaughMap {
public:
    using Key = std::vector<bool>;

    KarnaughMap(std::vector<Variable> variables, std::map<Key, bool> cells);

    const std::vector<Variable>& variables() const noexcept { return vars_; }
    const std::map<Key, bool>&   cells() const noexcept { return cells_; }
    std::size_t                  size() const noexcept { return cells_.size(); }

    /// Result for one assignment tuple (variable order).
    /// Throws std::out_of_range if the tuple has the wrong arity.
    bool at(const Key& assignment) const;

    /// Grid arrangement for display.
    KmapLayout layout() const;

private:
    std::vector<Variable> vars_;
    std::map<Key, bool>   cells_;
};

/// Gray-code sequence over `bits` bits, most significant bit first.
std::vector<std::vector<bool>> gray_code(std::size_t bits);

/// Karnaugh map of `table`, or std::nullopt unless 2 <= n <= 4.
/// Throws std::invalid_argument if `variables` does not match the table
/// or the table does not hold 2^n rows.
std::optional<KarnaughMap> build_kmap(const std::vector<Variable>& variables,
                                      const TruthTable& table);

/// Text grid of `kmap` in layout() order.
std::string render_kmap(const KarnaughMap& kmap);

}  // namespace truthtab

#endif  // TRUTHTAB_KMAP_HPP
