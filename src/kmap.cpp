// ============================================================================
// kmap.cpp — Karnaugh map construction and rendering
// ============================================================================

#include "truthtab/kmap.hpp"

#include <sstream>
#include <stdexcept>

namespace truthtab {

// ── gray_code ───────────────────────────────────────────────────────────────

std::vector<std::vector<bool>> gray_code(std::size_t bits) {
    std::vector<std::vector<bool>> seq;
    const std::size_t count = std::size_t{1} << bits;
    for (std::size_t i = 0; i < count; ++i) {
        seq.push_back(row_values(i ^ (i >> 1), bits));
    }
    return seq;
}

// ── KarnaughMap ─────────────────────────────────────────────────────────────

KarnaughMap::KarnaughMap(std::vector<Variable> variables, std::map<Key, bool> cells)
    : vars_(std::move(variables)), cells_(std::move(cells)) {}

bool KarnaughMap::at(const Key& assignment) const {
    if (assignment.size() != vars_.size()) {
        throw std::out_of_range(
            "KarnaughMap::at: expected " + std::to_string(vars_.size()) +
            " values, got " + std::to_string(assignment.size()));
    }
    auto it = cells_.find(assignment);
    if (it == cells_.end()) {
        throw std::out_of_range("KarnaughMap::at: no cell for assignment");
    }
    return it->second;
}

KmapLayout KarnaughMap::layout() const {
    const std::size_t n_rows = vars_.size() / 2;

    KmapLayout l;
    l.row_vars.assign(vars_.begin(), vars_.begin() + static_cast<std::ptrdiff_t>(n_rows));
    l.col_vars.assign(vars_.begin() + static_cast<std::ptrdiff_t>(n_rows), vars_.end());
    l.row_keys = gray_code(l.row_vars.size());
    l.col_keys = gray_code(l.col_vars.size());
    return l;
}

// ── build_kmap ──────────────────────────────────────────────────────────────

std::optional<KarnaughMap> build_kmap(const std::vector<Variable>& variables,
                                      const TruthTable& table) {
    const std::size_t n = variables.size();
    if (n < kKmapMinVariables || n > kKmapMaxVariables) {
        return std::nullopt;
    }

    if (table.variables != variables) {
        throw std::invalid_argument("build_kmap: variables do not match the table");
    }
    if (table.size() != (std::size_t{1} << n)) {
        throw std::invalid_argument(
            "build_kmap: expected " + std::to_string(std::size_t{1} << n) +
            " rows, got " + std::to_string(table.size()));
    }

    std::map<KarnaughMap::Key, bool> cells;
    for (const auto& row : table.rows) {
        if (row.values.size() != n) {
            throw std::invalid_argument(
                "build_kmap: row has " + std::to_string(row.values.size()) +
                " values for " + std::to_string(n) + " variables");
        }
        cells[row.values] = row.result;
    }
    return KarnaughMap(variables, std::move(cells));
}

// ── render_kmap ─────────────────────────────────────────────────────────────

namespace {

std::string bits(const std::vector<bool>& key) {
    std::string s;
    for (bool b : key) s += b ? '1' : '0';
    return s;
}

std::string pad_left(const std::string& s, std::size_t width) {
    return s.size() >= width ? s : std::string(width - s.size(), ' ') + s;
}

}  // namespace

std::string render_kmap(const KarnaughMap& kmap) {
    KmapLayout l = kmap.layout();

    std::string corner = std::string(l.row_vars.begin(), l.row_vars.end()) + "\\" +
                         std::string(l.col_vars.begin(), l.col_vars.end());
    const std::size_t cell_w = l.col_vars.size() + 1;

    std::ostringstream out;
    out << corner << " |";
    for (const auto& ck : l.col_keys) out << pad_left(bits(ck), cell_w);
    out << '\n'
        << std::string(corner.size() + 1, '-') << '+'
        << std::string(cell_w * l.col_keys.size(), '-') << '\n';

    for (const auto& rk : l.row_keys) {
        out << pad_left(bits(rk), corner.size()) << " |";
        for (const auto& ck : l.col_keys) {
            KarnaughMap::Key key = rk;
            key.insert(key.end(), ck.begin(), ck.end());
            out << pad_left(kmap.at(key) ? "1" : "0", cell_w);
        }
        out << '\n';
    }
    return out.str();
}

}  // namespace truthtab
