// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "truthtab/cli.hpp"
#include "truthtab/ast.hpp"
#include "truthtab/export.hpp"
#include "truthtab/kmap.hpp"
#include "truthtab/normal_form.hpp"
#include "truthtab/parser.hpp"
#include "truthtab/test.hpp"
#include "truthtab/truth_table.hpp"
#include "truthtab/utils.hpp"
#include "truthtab/z3_solver.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace truthtab {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--dnf") {
            opts.show_dnf = true;
        } else if (arg == "--cnf") {
            opts.show_cnf = true;
        } else if (arg == "--kmap") {
            opts.show_kmap = true;
        } else if (arg == "--check") {
            opts.show_checks = true;
        } else if (arg == "--all") {
            opts.show_dnf = opts.show_cnf = opts.show_kmap = opts.show_checks = true;
        } else if (arg == "--tsv") {
            opts.tsv = true;
        } else if (arg == "--verify") {
            opts.verify = true;
        } else if (arg == "--csv") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--csv requires a file argument");
            }
            opts.csv_path = argv[++i];
        } else if (arg == "--equiv") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--equiv requires a formula argument");
            }
            opts.equiv_with = argv[++i];
            if (trim(opts.equiv_with).empty()) {
                throw std::runtime_error("--equiv requires a non-empty formula");
            }
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple inputs not supported (quote the formula)");
            }
            opts.input = arg;
        }
    }

    // Validate: need either --selftest or an input.
    if (!opts.selftest && !opts.help && opts.input.empty()) {
        throw std::runtime_error("no formula or input file specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [OPTIONS] <formula | input.txt>\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Truth table generator for propositional formulas.\n"
        << "\n"
        << "Options:\n"
        << "  <formula> | <input.txt>  Formula, or file with one formula per line\n"
        << "  --dnf           Show the canonical disjunctive normal form\n"
        << "  --cnf           Show the canonical conjunctive normal form\n"
        << "  --kmap          Show the Karnaugh map (2 to 4 variables)\n"
        << "  --check         Report tautology / contradiction\n"
        << "  --all           Same as --dnf --cnf --kmap --check\n"
        << "  --tsv           Print the table tab-separated\n"
        << "  --csv <path>    Save the table as CSV\n"
        << "  --verify        Check DNF and CNF against the formula with Z3\n"
        << "  --equiv <f>     Check each formula for equivalence with <f> using Z3\n"
        << "  --selftest      Run built-in tests\n"
        << "  --help, -h      Show this message\n"
        << "\n"
        << "Operators (case-insensitive):\n"
        << "  NOT A, A AND B, A OR B, A XOR B, XOR(A,B), A -> B, A IMPLIES B,\n"
        << "  A <-> B, A EQUIV B, NAND(A,B), NOR(A,B), TRUE, FALSE\n"
        << "  Symbols ! & | ^ may be used for NOT AND OR XOR.\n"
        << "  Variables are single letters A-Z.  Use parentheses to group.\n"
        << "\n"
        << "Input file format:\n"
        << "  - One formula per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── csv_path_for_line ───────────────────────────────────────────────────────

std::string csv_path_for_line(const std::string& path, unsigned line) {
    std::filesystem::path p(path);
    std::string name = p.stem().string() + "_" + std::to_string(line) + p.extension().string();
    return (p.parent_path() / name).string();
}

// ── report ──────────────────────────────────────────────────────────────────
// Print everything requested for one formula.  Returns false if a --verify
// check failed.

namespace {

bool report(const Options& opts, const Formula& formula, const TruthTable& table,
            const Expr* equiv_with, std::uint32_t line_num, bool multi_line) {
    const auto& vars = formula.variables();
    bool ok = true;

    std::cout << line_num << ": " << formula.text() << "\n";
    std::cout << (opts.tsv ? to_tsv(table) : format_table(table));
    std::cout << "  Generated " << table.size() << " rows.\n";

    if (opts.show_checks) {
        std::cout << "  Formula " << (is_tautology(table) ? "is" : "is NOT")
                  << " a tautology.\n";
        std::cout << "  Formula " << (is_contradiction(table) ? "is" : "is NOT")
                  << " a contradiction.\n";
    }

    std::string dnf;
    std::string cnf;
    if (opts.show_dnf || opts.verify) dnf = build_dnf(vars, table);
    if (opts.show_cnf || opts.verify) cnf = build_cnf(vars, table);

    if (opts.show_dnf) std::cout << "  DNF: " << dnf << "\n";
    if (opts.show_cnf) std::cout << "  CNF: " << cnf << "\n";

    if (opts.show_kmap) {
        std::optional<KarnaughMap> kmap = build_kmap(vars, table);
        if (kmap) {
            std::cout << render_kmap(*kmap);
        } else {
            std::cout << "  K-Map only supported for 2 to 4 variables ("
                      << vars.size() << " given).\n";
        }
    }

    if (opts.verify || equiv_with) {
        Z3Checker checker;

        if (opts.verify) {
            bool dnf_ok = checker.are_equivalent(formula.expr(), *parse(dnf));
            bool cnf_ok = checker.are_equivalent(formula.expr(), *parse(cnf));
            bool taut_ok = checker.is_valid(formula.expr()) == is_tautology(table);
            std::cout << "  Z3: DNF " << (dnf_ok ? "equivalent" : "NOT equivalent")
                      << ", CNF " << (cnf_ok ? "equivalent" : "NOT equivalent")
                      << ", tautology check " << (taut_ok ? "agrees" : "DISAGREES") << "\n";
            if (!dnf_ok || !cnf_ok || !taut_ok) {
                std::cerr << line_num << ": ERROR: Z3 cross-check failed\n";
                ok = false;
            }
        }

        if (equiv_with) {
            if (checker.are_equivalent(formula.expr(), *equiv_with)) {
                std::cout << "  Equivalent to " << opts.equiv_with << ".\n";
            } else {
                ExprPtr differ = make_not(make_equiv(clone(formula.expr()), clone(*equiv_with)));
                std::cout << "  NOT equivalent to " << opts.equiv_with;
                if (checker.check(*differ) == Z3Result::SAT) {
                    std::cout << "; they differ at " << checker.model();
                }
                std::cout << ".\n";
            }
        }
    }

    if (!opts.csv_path.empty()) {
        std::string path = multi_line ? csv_path_for_line(opts.csv_path, line_num)
                                      : opts.csv_path;
        write_csv(path, table);
        std::cout << "  Saved to " << path << "\n";
    }

    return ok;
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver loop.  Reads the input, processes each formula line,
// prints results.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    if (opts.input.empty()) {
        std::cerr << "ERROR: no input specified (use --help for usage)\n";
        return 1;
    }

    // ── Collect formulas ────────────────────────────────────────────────
    // An argument ending in .txt is a file with one formula per line;
    // anything else is a single formula.
    std::vector<std::string> formulas;
    bool is_file = opts.input.ends_with(".txt");
    if (is_file) {
        try {
            formulas = read_lines(opts.input);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    } else {
        formulas.push_back(opts.input);
    }

    // ── Comparison formula for --equiv ──────────────────────────────────
    ExprPtr equiv_with;
    if (!opts.equiv_with.empty()) {
        try {
            equiv_with = parse(opts.equiv_with);
        } catch (const ParseError& e) {
            std::cerr << "--equiv: " << e.what() << "\n";
            return 1;
        }
    }

    // ── Process each line ───────────────────────────────────────────────
    bool had_errors = false;
    bool processed = false;

    for (std::size_t i = 0; i < formulas.size(); ++i) {
        std::uint32_t line_num = static_cast<std::uint32_t>(i + 1);
        // '#' comments exist only in formula files; on the command line a
        // '#' is part of the formula and the parser rejects it.
        std::string content = is_file ? strip_comment(formulas[i]) : trim(formulas[i]);

        // Skip blank / comment-only lines.
        if (content.empty()) {
            continue;
        }
        processed = true;

        try {
            Formula formula = Formula::parse(content, line_num);
            TruthTable table = generate_table(formula.variables(), formula.expr());
            if (!report(opts, formula, table, equiv_with.get(), line_num, is_file)) {
                had_errors = true;
            }
        } catch (const ParseError& e) {
            // Parse errors already carry line and column.
            std::cerr << e.what() << "\n";
            had_errors = true;
        } catch (const std::exception& e) {
            std::cerr << line_num << ": ERROR: " << e.what() << "\n";
            had_errors = true;
        }
    }

    if (!processed) {
        std::cerr << "ERROR: Please enter a formula.\n";
        return 1;
    }

    return had_errors ? 1 : 0;
}

}  // namespace truthtab
