// ============================================================================
// export.cpp — CSV / TSV rendering and CSV import
// ============================================================================

#include "truthtab/export.hpp"
#include "truthtab/utils.hpp"

#include <fstream>
#include <stdexcept>

namespace truthtab {

// ── to_csv / to_tsv ─────────────────────────────────────────────────────────

namespace {

std::string render(const TruthTable& table, char sep) {
    std::string out;
    for (Variable v : table.variables) {
        out += v;
        out += sep;
    }
    out += "Result\n";

    for (const auto& row : table.rows) {
        for (bool b : row.values) {
            out += b ? '1' : '0';
            out += sep;
        }
        out += row.result ? '1' : '0';
        out += '\n';
    }
    return out;
}

[[noreturn]] void csv_error(std::size_t line, const std::string& msg) {
    throw std::runtime_error("csv line " + std::to_string(line) + ": " + msg);
}

}  // namespace

std::string to_csv(const TruthTable& table) {
    return render(table, ',');
}

std::string to_tsv(const TruthTable& table) {
    return render(table, '\t');
}

// ── from_csv ────────────────────────────────────────────────────────────────

TruthTable from_csv(std::string_view text) {
    std::vector<std::string> lines = split(text, '\n');

    TruthTable table;
    bool have_header = false;
    std::size_t arity = 0;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::size_t line_no = i + 1;
        std::string line = trim(lines[i]);
        if (line.empty()) continue;

        std::vector<std::string> cells = split(line, ',');
        for (auto& c : cells) c = trim(c);

        if (!have_header) {
            if (cells.empty() || cells.back() != "Result") {
                csv_error(line_no, "header must end with 'Result'");
            }
            for (std::size_t k = 0; k + 1 < cells.size(); ++k) {
                const std::string& name = cells[k];
                if (name.size() != 1 || name[0] < 'A' || name[0] > 'Z') {
                    csv_error(line_no, "bad variable name '" + name + "'");
                }
                for (Variable seen : table.variables) {
                    if (seen == name[0]) csv_error(line_no, "duplicate variable '" + name + "'");
                }
                table.variables.push_back(name[0]);
            }
            arity = table.variables.size();
            if (arity > kMaxVariables) {
                csv_error(line_no, "more than " + std::to_string(kMaxVariables) + " variables");
            }
            have_header = true;
            continue;
        }

        if (cells.size() != arity + 1) {
            csv_error(line_no, "expected " + std::to_string(arity + 1) +
                               " cells, got " + std::to_string(cells.size()));
        }

        TruthTableRow row;
        for (std::size_t k = 0; k < cells.size(); ++k) {
            if (cells[k] != "0" && cells[k] != "1") {
                csv_error(line_no, "cell '" + cells[k] + "' is not 0 or 1");
            }
            bool v = cells[k] == "1";
            if (k < arity) row.values.push_back(v);
            else           row.result = v;
        }
        if (row.values != row_values(table.rows.size(), arity)) {
            csv_error(line_no, "row " + std::to_string(table.rows.size()) +
                               " is out of binary counting order");
        }
        table.rows.push_back(std::move(row));
    }

    if (!have_header) {
        csv_error(1, "missing header");
    }
    const std::size_t expected = std::size_t{1} << arity;
    if (table.rows.size() != expected) {
        csv_error(lines.size(), "expected " + std::to_string(expected) + " rows, got " +
                                std::to_string(table.rows.size()));
    }
    return table;
}

// ── write_csv ───────────────────────────────────────────────────────────────

void write_csv(const std::string& path, const TruthTable& table) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file for writing: " + path);
    }
    file << to_csv(table);
    if (!file) {
        throw std::runtime_error("failed writing file: " + path);
    }
}

}  // namespace truthtab
