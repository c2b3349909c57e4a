// ============================================================================
// test.cpp — Self-test suite for the truthtab tool
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation and variable extraction
//   - Parser precedence, associativity, function calls and errors
//   - Evaluator semantics for every connective
//   - Truth-table row order, sizes and predicates
//   - DNF / CNF strings and their re-evaluation
//   - Z3 cross-checks
//   - Karnaugh maps
//   - CSV / TSV export and import
//   - Command-line argument handling and the per-line driver
//
// ============================================================================

#include "truthtab/test.hpp"
#include "truthtab/ast.hpp"
#include "truthtab/cli.hpp"
#include "truthtab/evaluator.hpp"
#include "truthtab/export.hpp"
#include "truthtab/kmap.hpp"
#include "truthtab/lexer.hpp"
#include "truthtab/normal_form.hpp"
#include "truthtab/parser.hpp"
#include "truthtab/truth_table.hpp"
#include "truthtab/utils.hpp"
#include "truthtab/z3_solver.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace truthtab {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    return to_string(*parse(input));
}

static bool parse_fails(const std::string& input) {
    try {
        parse(input);
        return false;
    } catch (const ParseError&) {
        return true;
    }
}

static TruthTable table_of(const std::string& input) {
    Formula f = Formula::parse(input);
    return generate_table(f.variables(), f.expr());
}

// Results column of a table as a 0/1 string, e.g. "0001".
static std::string results(const TruthTable& t) {
    std::string s;
    for (const auto& r : t.rows) s += r.result ? '1' : '0';
    return s;
}

static std::vector<Variable> vars(const std::string& letters) {
    return std::vector<Variable>(letters.begin(), letters.end());
}

// Formulas used by the property-style tests below.
static const std::vector<std::string> kSampleFormulas = {
    "A AND B",
    "A OR NOT A",
    "A AND NOT A",
    "A -> B",
    "A <-> B",
    "NAND(A, B)",
    "NOR(A, B)",
    "A XOR B XOR C",
    "(A -> B) AND (B -> C) -> (A -> C)",
    "NAND(NOR(A, B), NOT (C OR D))",
    "XOR(A AND B, C) <-> NOT D",
    "A IMPLIES B EQUIV NOT B IMPLIES NOT A",
    "(A OR B) AND (C OR D) AND NOT (A AND C)",
    "TRUE",
    "FALSE",
    "A AND TRUE OR FALSE",
};

// ============================================================================
// Lexer Tests
// ============================================================================

static void test_lexer_keywords(TestContext& ctx) {
    auto toks = tokenise("a and B Or not c xor nand nor implies equiv true false");
    ctx.check(toks[0].kind == TokenKind::Variable && toks[0].text == "A", "variable a uppercased");
    ctx.check(toks[1].kind == TokenKind::KwAnd, "and keyword");
    ctx.check(toks[2].kind == TokenKind::Variable && toks[2].text == "B", "variable B");
    ctx.check(toks[3].kind == TokenKind::KwOr, "Or keyword");
    ctx.check(toks[4].kind == TokenKind::KwNot, "not keyword");
    ctx.check(toks[5].kind == TokenKind::Variable, "variable c");
    ctx.check(toks[6].kind == TokenKind::KwXor, "xor keyword");
    ctx.check(toks[7].kind == TokenKind::KwNand, "nand keyword");
    ctx.check(toks[8].kind == TokenKind::KwNor, "nor keyword");
    ctx.check(toks[9].kind == TokenKind::KwImplies, "implies keyword");
    ctx.check(toks[10].kind == TokenKind::KwEquiv, "equiv keyword");
    ctx.check(toks[11].kind == TokenKind::KwTrue, "true keyword");
    ctx.check(toks[12].kind == TokenKind::KwFalse, "false keyword");
    ctx.check(toks[13].kind == TokenKind::Eof, "trailing EOF");
}

static void test_lexer_symbols(TestContext& ctx) {
    auto toks = tokenise("-> <-> ! & | ^ ( ) ,");
    ctx.check(toks[0].kind == TokenKind::Arrow, "-> operator");
    ctx.check(toks[1].kind == TokenKind::DoubleArrow, "<-> operator");
    ctx.check(toks[2].kind == TokenKind::Bang, "! operator");
    ctx.check(toks[3].kind == TokenKind::Amp, "& operator");
    ctx.check(toks[4].kind == TokenKind::Pipe, "| operator");
    ctx.check(toks[5].kind == TokenKind::Caret, "^ operator");
    ctx.check(toks[6].kind == TokenKind::LParen, "( paren");
    ctx.check(toks[7].kind == TokenKind::RParen, ") paren");
    ctx.check(toks[8].kind == TokenKind::Comma, "comma");

    auto tight = tokenise("A->B<->C");
    ctx.check(tight.size() == 6, "operators need no surrounding spaces");
    ctx.check(tight[1].kind == TokenKind::Arrow && tight[3].kind == TokenKind::DoubleArrow,
              "-> and <-> without spaces");
}

static void test_lexer_unknown_and_positions(TestContext& ctx) {
    auto toks = tokenise("AB $ <- A1");
    ctx.check(toks[0].kind == TokenKind::Unknown && toks[0].text == "AB", "multi-letter word is unknown");
    ctx.check(toks[1].kind == TokenKind::Unknown && toks[1].text == "$", "$ is unknown");
    ctx.check(toks[2].kind == TokenKind::Unknown && toks[2].text == "<", "lone < is unknown");
    ctx.check(toks[3].kind == TokenKind::Unknown && toks[3].text == "-", "lone - is unknown");
    ctx.check(toks[4].kind == TokenKind::Unknown && toks[4].text == "A1", "letter+digit is unknown");

    auto pos = tokenise("A  AND\n  B");
    ctx.check(pos[0].pos.line == 1 && pos[0].pos.column == 1, "A at 1:1");
    ctx.check(pos[1].pos.line == 1 && pos[1].pos.column == 4, "AND at 1:4");
    ctx.check(pos[2].pos.line == 2 && pos[2].pos.column == 3, "B at 2:3");
}

static void test_extract_variables(TestContext& ctx) {
    ctx.check(extract_variables("A AND B") == vars("AB"), "A AND B");
    ctx.check(extract_variables("c or b and a") == vars("ABC"), "sorted, case-insensitive");
    ctx.check(extract_variables("NOT X OR x") == vars("X"), "deduplicated");
    ctx.check(extract_variables("nand(a,b) or nor(c,d)") == vars("ABCD"), "function arguments");
    ctx.check(extract_variables("A AND NOT A NOR OR XOR NAND") == vars("A"),
              "keyword letters are not variables");
    ctx.check(extract_variables("AB OR A1 OR A_").empty(), "multi-character words are not variables");
    ctx.check(extract_variables("TRUE AND FALSE").empty(), "constants have no variables");
    ctx.check(extract_variables("").empty(), "empty text");
    ctx.check(extract_variables("(A)->(Z)") == vars("AZ"), "letters next to symbols");
    ctx.check(normalize("a Nd") == "A ND", "normalize uppercases");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_precedence(TestContext& ctx) {
    ctx.check_eq(pp("A OR B AND C"), "(A OR (B AND C))", "AND binds tighter than OR");
    ctx.check_eq(pp("A AND B OR C"), "((A AND B) OR C)", "AND binds tighter than OR (left)");
    ctx.check_eq(pp("NOT A AND B"), "(NOT A AND B)", "NOT binds tighter than AND");
    ctx.check_eq(pp("NOT (A AND B)"), "NOT (A AND B)", "NOT applies to group");
    ctx.check_eq(pp("A XOR B OR C"), "(A XOR (B OR C))", "OR binds tighter than XOR");
    ctx.check_eq(pp("A -> B XOR C"), "(A -> (B XOR C))", "XOR binds tighter than ->");
    ctx.check_eq(pp("A -> B <-> C"), "((A -> B) <-> C)", "-> binds tighter than <->");
    ctx.check_eq(pp("A <-> B -> C"), "(A <-> (B -> C))", "-> binds tighter than <-> (right)");
    ctx.check_eq(pp("A OR B -> C XOR D"), "((A OR B) -> (C XOR D))", "mixed levels");
    ctx.check_eq(pp("NOT NOT A"), "NOT NOT A", "double negation");
    ctx.check_eq(pp("((A))"), "A", "redundant parens");
}

static void test_parse_associativity(TestContext& ctx) {
    ctx.check_eq(pp("A AND B AND C"), "((A AND B) AND C)", "AND left-assoc");
    ctx.check_eq(pp("A OR B OR C"), "((A OR B) OR C)", "OR left-assoc");
    ctx.check_eq(pp("A XOR B XOR C"), "((A XOR B) XOR C)", "XOR left-assoc");
    ctx.check_eq(pp("A -> B -> C"), "((A -> B) -> C)", "-> left-assoc");
    ctx.check_eq(pp("A <-> B <-> C"), "((A <-> B) <-> C)", "<-> left-assoc");
    ctx.check_eq(pp("A -> (B -> C)"), "(A -> (B -> C))", "explicit grouping");
}

static void test_parse_spellings(TestContext& ctx) {
    ctx.check_eq(pp("a and b"), "(A AND B)", "lowercase input");
    ctx.check_eq(pp("!A & B | C ^ D"), "(((NOT A AND B) OR C) XOR D)", "symbol aliases");
    ctx.check_eq(pp("A IMPLIES B EQUIV C"), "((A -> B) <-> C)", "IMPLIES / EQUIV keywords");
    ctx.check_eq(pp("A->B"), "(A -> B)", "no spaces");
    ctx.check_eq(pp("true and not False"), "(TRUE AND NOT FALSE)", "constants");
}

static void test_parse_functions(TestContext& ctx) {
    ctx.check_eq(pp("NAND(A,B)"), "NAND(A, B)", "NAND call");
    ctx.check_eq(pp("NOR(A, B)"), "NOR(A, B)", "NOR call");
    ctx.check_eq(pp("XOR(A, B)"), "(A XOR B)", "XOR call form");
    ctx.check_eq(pp("NAND(NOR(A,B), C)"), "NAND(NOR(A, B), C)", "nested call as argument");
    ctx.check_eq(pp("NOR(NAND(A,B), NOT (C OR D))"), "NOR(NAND(A, B), NOT (C OR D))",
                 "nested parens and NOT in arguments");
}

static void test_parse_functions_nested(TestContext& ctx) {
    ctx.check_eq(pp("NAND(A -> B, C <-> D)"), "NAND((A -> B), (C <-> D))",
                 "full formulas as arguments");
    ctx.check_eq(pp("NOT NAND(A, B) AND C"), "(NOT NAND(A, B) AND C)", "NOT applies to call");
    ctx.check_eq(pp("NAND(A, B) OR NOR(C, D)"), "(NAND(A, B) OR NOR(C, D))", "calls as operands");
    ctx.check_eq(pp("nand(nand(a, b), nand(c, (d)))"), "NAND(NAND(A, B), NAND(C, D))",
                 "lowercase nested calls");
}

static void test_parse_roundtrip(TestContext& ctx) {
    for (const auto& src : kSampleFormulas) {
        ExprPtr a = parse(src);
        ExprPtr b = parse(to_string(*a));
        ctx.check(equal(*a, *b), "to_string re-parses to equal tree: " + src);
        ctx.check(equal(*a, *clone(*a)), "clone is equal: " + src);
    }
}

static void test_parse_errors(TestContext& ctx) {
    ctx.check(parse_fails("A AND (B"), "unmatched (");
    ctx.check(parse_fails("(A"), "unmatched ( alone");
    ctx.check(parse_fails("A)"), "unmatched )");
    ctx.check(parse_fails(""), "empty formula");
    ctx.check(parse_fails("   "), "whitespace only");
    ctx.check(parse_fails("()"), "empty parens");
    ctx.check(parse_fails("A B"), "missing operator");
    ctx.check(parse_fails("AB"), "multi-letter word");
    ctx.check(parse_fails("A $ B"), "unknown character");
    ctx.check(parse_fails("A AND"), "missing right operand");
    ctx.check(parse_fails("NOT"), "NOT without operand");
    ctx.check(parse_fails("A -> "), "dangling ->");
    ctx.check(parse_fails("NAND(A)"), "NAND with one argument");
    ctx.check(parse_fails("NAND()"), "NAND with no arguments");
    ctx.check(parse_fails("NAND(A,B,C)"), "NAND with three arguments");
    ctx.check(parse_fails("NOR(A,"), "NOR truncated");
    ctx.check(parse_fails("NAND(A,B"), "NAND unclosed");
    ctx.check(parse_fails("NAND A"), "NAND without parens");
    ctx.check(parse_fails("A NAND B"), "NAND is not infix");
    ctx.check(parse_fails("XOR A"), "XOR call without parens");
    ctx.check(parse_fails("A <= B"), "<= is not an operator");
    ctx.check(parse_fails("A, B"), "top-level comma");
}

static std::string repeat(const std::string& s, std::size_t n) {
    std::string out;
    out.reserve(s.size() * n);
    for (std::size_t i = 0; i < n; ++i) out += s;
    return out;
}

static void test_parse_nesting_limit(TestContext& ctx) {
    const std::size_t limit = kMaxNestingDepth;

    ExprPtr nots = parse(repeat("NOT ", limit - 1) + "A");
    ctx.check(node_count(*nots) == limit, "NOT chain just under the limit parses");
    ctx.check(parse_fails(repeat("NOT ", limit) + "A"), "NOT chain at the limit is rejected");
    ctx.check(parse_fails(repeat("NOT ", 100000) + "A"), "very long NOT chain is rejected");

    ExprPtr parens = parse(repeat("(", limit - 1) + "A" + repeat(")", limit - 1));
    ctx.check(node_count(*parens) == 1, "parentheses just under the limit parse");
    ctx.check(parse_fails(repeat("(", 200000) + "A" + repeat(")", 200000)),
              "very deep parentheses are rejected");
    ctx.check(parse_fails(repeat("NAND(A, ", 5000) + "B" + repeat(")", 5000)),
              "very deep calls are rejected");

    try {
        parse(repeat("!", 2 * limit) + "A");
        ctx.check(false, "deep ! chain should throw");
    } catch (const ParseError& e) {
        ctx.check(std::string(e.what()).find("nesting too deep") != std::string::npos,
                  "nesting message");
        ctx.check(e.pos().column == limit + 1, "reported at the first token past the limit");
    }

    ctx.check(!parse_fails(repeat("A AND ", 5000) + "A"), "long flat chains are not nesting");
}

static void test_parse_error_details(TestContext& ctx) {
    try {
        parse("A AND (B");
        ctx.check(false, "A AND (B should throw");
    } catch (const ParseError& e) {
        ctx.check_eq(e.fragment(), "(", "fragment of unmatched (");
        ctx.check(e.pos().line == 1 && e.pos().column == 7, "position of unmatched (");
        ctx.check(std::string(e.what()).find("1: ERROR: ") == 0, "message prefix");
        ctx.check(std::string(e.what()).find("at column 7") != std::string::npos, "message column");
    }

    try {
        parse("A $ B");
        ctx.check(false, "A $ B should throw");
    } catch (const ParseError& e) {
        ctx.check_eq(e.fragment(), "$", "fragment of unknown token");
        ctx.check(e.pos().column == 3, "column of unknown token");
    }

    try {
        parse("NAND(A, B, C)");
        ctx.check(false, "NAND with 3 arguments should throw");
    } catch (const ParseError& e) {
        ctx.check_eq(e.fragment(), ",", "fragment of surplus argument separator");
        ctx.check(std::string(e.what()).find("exactly two arguments") != std::string::npos,
                  "arity message");
    }

    try {
        parse("  ", 4);
        ctx.check(false, "blank input should throw");
    } catch (const ParseError& e) {
        ctx.check(std::string(e.what()).find("empty formula") != std::string::npos, "empty message");
        ctx.check(e.pos().line == 4, "line number passed through");
    }

    try {
        parse("A OR B)");
        ctx.check(false, "stray ) should throw");
    } catch (const ParseError& e) {
        ctx.check_eq(e.fragment(), ")", "fragment of stray )");
        ctx.check(e.pos().column == 7, "column of stray )");
    }
}

static void test_formula_object(TestContext& ctx) {
    Formula f = Formula::parse("c -> a and NOT b");
    ctx.check_eq(f.text(), "c -> a and NOT b", "text kept verbatim");
    ctx.check(f.variables() == vars("ABC"), "variables sorted");
    ctx.check(f.variables() == variables_of(f.expr()), "variables agree with tree");
    ctx.check(node_count(f.expr()) == 6, "node count");

    bool threw = false;
    try {
        Formula bad = Formula::parse("A AND");
        ctx.check(false, "invalid text yields no Formula: " + bad.text());
    } catch (const ParseError&) {
        threw = true;
    }
    ctx.check(threw, "Formula::parse throws ParseError");
}

// ============================================================================
// Evaluator Tests
// ============================================================================

static void test_evaluator_semantics(TestContext& ctx) {
    struct Case {
        const char* formula;
        const char* expected;   // results for AB = 00, 01, 10, 11
    };
    const Case cases[] = {
        {"A AND B",     "0001"},
        {"A OR B",      "0111"},
        {"A XOR B",     "0110"},
        {"A -> B",      "1101"},
        {"A <-> B",     "1001"},
        {"NAND(A, B)",  "1110"},
        {"NOR(A, B)",   "1000"},
        {"NOT A",       "1100"},
        {"NOT B",       "1010"},
        {"B -> A",      "1011"},
    };

    for (const auto& c : cases) {
        ExprPtr e = parse(c.formula);
        std::string got;
        for (int i = 0; i < 4; ++i) {
            Assignment a = make_assignment(vars("AB"), row_values(i, 2));
            got += evaluate(*e, a) ? '1' : '0';
        }
        ctx.check_eq(got, c.expected, std::string("semantics of ") + c.formula);
    }

    ctx.check(evaluate(*parse("TRUE"), {}), "TRUE constant");
    ctx.check(!evaluate(*parse("FALSE"), {}), "FALSE constant");
    ctx.check(evaluate(*parse("A"), {{'A', true}, {'Z', false}}), "extra variables are ignored");
}

static void test_evaluator_missing_variable(TestContext& ctx) {
    ExprPtr e = parse("A AND B");
    try {
        evaluate(*e, {{'A', false}});
        ctx.check(false, "missing B should throw");
    } catch (const EvaluationError& err) {
        ctx.check(err.variable() == 'B', "missing variable reported");
        ctx.check(std::string(err.what()).find("'B'") != std::string::npos, "message names B");
    }

    ctx.check_throws<EvaluationError>([] { evaluate(*parse("A OR B"), {{'A', true}}); },
                                      "no short-circuit around a missing variable");
    ctx.check_throws<std::invalid_argument>([] { make_assignment(vars("AB"), {true}); },
                                            "make_assignment length mismatch");

    ctx.check_throws<EvaluationError>([&] { evaluate(*e, {}); }, "empty assignment");
}

// ============================================================================
// Truth Table Tests
// ============================================================================

static void test_table_order(TestContext& ctx) {
    TruthTable t = table_of("A AND B AND C");
    ctx.check(t.variables == vars("ABC"), "variables in table");
    ctx.check(t.size() == 8, "8 rows");
    for (std::size_t i = 0; i < t.size(); ++i) {
        const auto& v = t.rows[i].values;
        std::size_t index = (v[0] ? 4 : 0) + (v[1] ? 2 : 0) + (v[2] ? 1 : 0);
        ctx.check(index == i, "row " + std::to_string(i) + " is binary counting, first variable MSB");
    }
    ctx.check(!t.rows[0].values[0] && t.rows[4].values[0], "first variable changes slowest");
    ctx.check(!t.rows[0].values[2] && t.rows[1].values[2], "last variable changes fastest");
    ctx.check_eq(results(t), "00000001", "AND of three");
}

static void test_table_sizes(TestContext& ctx) {
    std::string formula = "A";
    const std::string letters = "ABCDEFGH";
    for (std::size_t n = 1; n <= letters.size(); ++n) {
        if (n > 1) formula += std::string(" OR ") + letters[n - 1];
        TruthTable t = table_of(formula);
        ctx.check(t.size() == (std::size_t{1} << n), std::to_string(n) + " variables give 2^n rows");
        ctx.check(true_count(t) == (std::size_t{1} << n) - 1, "only the all-false row is false");
    }
}

static void test_table_scenarios(TestContext& ctx) {
    TruthTable and_t = table_of("A AND B");
    ctx.check_eq(results(and_t), "0001", "A AND B rows");
    ctx.check(!and_t.rows[1].values[0] && and_t.rows[1].values[1], "row 1 is (F,T)");
    ctx.check(!is_tautology(and_t) && !is_contradiction(and_t), "A AND B neither");

    TruthTable taut = table_of("A OR NOT A");
    ctx.check(taut.size() == 2, "A OR NOT A has 2 rows");
    ctx.check(is_tautology(taut), "A OR NOT A is a tautology");
    ctx.check(!is_contradiction(taut), "A OR NOT A is not a contradiction");

    ctx.check_eq(results(table_of("A -> B")), "1101", "implication, not plain OR");
    ctx.check_eq(results(table_of("NAND(A,B)")), "1110", "NAND(A,B)");

    TruthTable contra = table_of("A AND NOT A");
    ctx.check(is_contradiction(contra), "A AND NOT A is a contradiction");
    ctx.check(!is_satisfiable(contra), "A AND NOT A is unsatisfiable");

    ctx.check(is_tautology(table_of("(A -> B) AND (B -> C) -> (A -> C)")), "transitivity");
    ctx.check(is_tautology(table_of("A IMPLIES B EQUIV NOT B IMPLIES NOT A")), "contraposition");
}

static void test_table_zero_variables(TestContext& ctx) {
    TruthTable t = table_of("TRUE");
    ctx.check(t.size() == 1, "one row");
    ctx.check(t.rows[0].values.empty(), "row has only the result");
    ctx.check(t.rows[0].result, "TRUE evaluates true");
    ctx.check(is_tautology(t) && !is_contradiction(t), "TRUE is a tautology only");

    TruthTable f = table_of("NOT TRUE OR FALSE");
    ctx.check(f.size() == 1 && !f.rows[0].result, "constant false row");
    ctx.check(is_contradiction(f) && !is_tautology(f), "constant false is a contradiction only");
}

static void test_table_errors(TestContext& ctx) {
    ctx.check_throws<EvaluationError>(
        [] { generate_table(vars("A"), *parse("A AND B")); },
        "variable list missing a formula variable");
    ctx.check_throws<std::invalid_argument>(
        [] { generate_table(vars("BA"), *parse("A AND B")); }, "unsorted variables");
    ctx.check_throws<std::invalid_argument>(
        [] { generate_table(vars("AAB"), *parse("A AND B")); }, "repeated variable");
    ctx.check_throws<std::length_error>(
        [] { generate_table(vars("ABCDEFGHIJKLMNOPQRSTU"), *parse("A")); },
        "more than kMaxVariables");
    ctx.check_throws<std::length_error>(
        [] { generate_table(vars("ABCDEFGHIJKLMNOPQRSTUVWXYZ"), *parse("TRUE")); },
        "all 26 letters");

    TruthTable wide = generate_table(vars("ABC"), *parse("A"));
    ctx.check(wide.size() == 8, "extra variables still enumerate");
    ctx.check_eq(results(wide), "00001111", "extra variables do not change the result");
}

static void test_format_table(TestContext& ctx) {
    ctx.check_eq(format_table(table_of("A AND B")),
                 "A B | Result\n0 0 | 0\n0 1 | 0\n1 0 | 0\n1 1 | 1\n", "aligned table");
    ctx.check_eq(format_table(table_of("TRUE")), "Result\n1\n", "zero-variable table");
}

// ============================================================================
// Canonical Form Tests
// ============================================================================

static void test_dnf_cnf_literals(TestContext& ctx) {
    TruthTable t = table_of("A AND B");
    ctx.check_eq(build_dnf(t.variables, t), "(A and B)", "DNF of A AND B");
    ctx.check_eq(build_cnf(t.variables, t), "(A or B) and (A or not B) and (not A or B)",
                 "CNF of A AND B");

    TruthTable taut = table_of("A OR NOT A");
    ctx.check_eq(build_dnf(taut.variables, taut), "(not A) or (A)", "DNF in row order");
    ctx.check_eq(build_cnf(taut.variables, taut), "True", "CNF of a tautology");

    TruthTable contra = table_of("A AND NOT A");
    ctx.check_eq(build_dnf(contra.variables, contra), "False", "DNF of a contradiction");
    ctx.check_eq(build_cnf(contra.variables, contra), "(A) and (not A)", "CNF of A AND NOT A");

    TruthTable impl = table_of("A -> B");
    ctx.check_eq(build_dnf(impl.variables, impl), "(not A and not B) or (not A and B) or (A and B)",
                 "DNF of A -> B");
    ctx.check_eq(build_cnf(impl.variables, impl), "(not A or B)", "CNF of A -> B");
}

static void test_dnf_cnf_constants(TestContext& ctx) {
    TruthTable t = table_of("TRUE");
    ctx.check_eq(build_dnf(t.variables, t), "True", "DNF of TRUE");
    ctx.check_eq(build_cnf(t.variables, t), "True", "CNF of TRUE");

    TruthTable f = table_of("FALSE");
    ctx.check_eq(build_dnf(f.variables, f), "False", "DNF of FALSE");
    ctx.check_eq(build_cnf(f.variables, f), "False", "CNF of FALSE");

    ctx.check_throws<std::invalid_argument>(
        [&] { build_dnf(vars("AB"), table_of("A")); }, "DNF arity mismatch");
    ctx.check_throws<std::invalid_argument>(
        [&] { build_cnf(vars("AB"), table_of("A")); }, "CNF arity mismatch");
}

static void test_dnf_cnf_reevaluate(TestContext& ctx) {
    for (const auto& src : kSampleFormulas) {
        TruthTable t = table_of(src);
        std::string dnf = build_dnf(t.variables, t);
        std::string cnf = build_cnf(t.variables, t);

        TruthTable from_dnf = generate_table(t.variables, *parse(dnf));
        TruthTable from_cnf = generate_table(t.variables, *parse(cnf));
        ctx.check(from_dnf == t, "DNF reproduces the table: " + src);
        ctx.check(from_cnf == t, "CNF reproduces the table: " + src);
    }
}

// ============================================================================
// Z3 Tests
// ============================================================================

static void test_z3_queries(TestContext& ctx) {
    Z3Checker z3;
    ctx.check(z3.is_valid(*parse("A OR NOT A")), "excluded middle is valid");
    ctx.check(!z3.is_satisfiable(*parse("A AND NOT A")), "A AND NOT A unsatisfiable");
    ctx.check(z3.is_satisfiable(*parse("A AND NOT B")), "A AND NOT B satisfiable");
    ctx.check_eq(z3.model(), "{A = true, B = false}", "model of A AND NOT B");

    ctx.check(z3.are_equivalent(*parse("A -> B"), *parse("NOT A OR B")), "implication");
    ctx.check(!z3.are_equivalent(*parse("A -> B"), *parse("A OR B")), "implication is not OR");
    ctx.check(z3.are_equivalent(*parse("NAND(A, B)"), *parse("NOT (A AND B)")), "NAND");
    ctx.check(z3.are_equivalent(*parse("NOR(A, B)"), *parse("NOT A AND NOT B")), "NOR");
    ctx.check(z3.are_equivalent(*parse("A XOR B"), *parse("NOT (A <-> B)")), "XOR");
    ctx.check(z3.check(*parse("TRUE")) == Z3Result::SAT, "TRUE is SAT");
    ctx.check(z3.check(*parse("FALSE")) == Z3Result::UNSAT, "FALSE is UNSAT");

    z3.reset();
    ctx.check(z3.model().empty(), "reset clears the model");
    ctx.check(z3.is_valid(*parse("(A -> B) AND (B -> C) -> (A -> C)")), "reuse after reset");
}

static void test_z3_agrees_with_tables(TestContext& ctx) {
    Z3Checker z3;
    for (const auto& src : kSampleFormulas) {
        Formula f = Formula::parse(src);
        TruthTable t = generate_table(f.variables(), f.expr());
        ctx.check(z3.is_valid(f.expr()) == is_tautology(t), "tautology agrees: " + src);
        ctx.check(z3.is_satisfiable(f.expr()) == is_satisfiable(t), "satisfiability agrees: " + src);
        ctx.check(z3.are_equivalent(f.expr(), *parse(build_dnf(t.variables, t))),
                  "Z3: DNF equivalent: " + src);
        ctx.check(z3.are_equivalent(f.expr(), *parse(build_cnf(t.variables, t))),
                  "Z3: CNF equivalent: " + src);
    }
}

// ============================================================================
// Karnaugh Map Tests
// ============================================================================

static void test_kmap_supported(TestContext& ctx) {
    const char* formulas[] = {"A AND B", "A XOR B XOR C", "NAND(A, B) OR NOR(C, D)"};
    for (const char* src : formulas) {
        TruthTable t = table_of(src);
        auto kmap = build_kmap(t.variables, t);
        ctx.check(kmap.has_value(), std::string("kmap built for ") + src);
        if (!kmap) continue;
        ctx.check(kmap->size() == t.size(), std::string("one cell per row: ") + src);
        ctx.check(kmap->variables() == t.variables, std::string("variables kept: ") + src);
        ctx.check(kmap->cells().begin()->first == t.rows.front().values &&
                  kmap->cells().rbegin()->first == t.rows.back().values,
                  std::string("cells keyed by assignment: ") + src);
        bool all_match = true;
        for (const auto& row : t.rows) {
            if (kmap->at(row.values) != row.result) all_match = false;
        }
        ctx.check(all_match, std::string("cells match rows: ") + src);
    }
}

static void test_kmap_unsupported(TestContext& ctx) {
    TruthTable one = table_of("NOT A");
    ctx.check(!build_kmap(one.variables, one).has_value(), "1 variable unsupported");

    TruthTable five = table_of("A AND B AND C AND D AND E");
    ctx.check(!build_kmap(five.variables, five).has_value(), "5 variables unsupported");

    TruthTable zero = table_of("TRUE");
    ctx.check(!build_kmap(zero.variables, zero).has_value(), "0 variables unsupported");

    TruthTable two = table_of("A OR B");
    ctx.check_throws<std::invalid_argument>(
        [&] { build_kmap(vars("ABC"), two); }, "variables do not match table");

    ctx.check_throws<std::invalid_argument>(
        [&] { build_kmap(vars("XY"), two); }, "same arity, different letters");

    TruthTable short_table = two;
    short_table.rows.pop_back();
    ctx.check_throws<std::invalid_argument>(
        [&] { build_kmap(two.variables, short_table); }, "table missing a row");

    auto kmap = build_kmap(two.variables, two);
    ctx.check_throws<std::out_of_range>([&] { kmap->at({true}); }, "lookup with wrong arity");
}

static void test_kmap_layout(TestContext& ctx) {
    auto gray = gray_code(3);
    ctx.check(gray.size() == 8, "gray code length");
    bool adjacent = true;
    for (std::size_t i = 0; i < gray.size(); ++i) {
        const auto& a = gray[i];
        const auto& b = gray[(i + 1) % gray.size()];
        int diff = 0;
        for (std::size_t k = 0; k < a.size(); ++k) diff += a[k] != b[k];
        if (diff != 1) adjacent = false;
    }
    ctx.check(adjacent, "neighbouring gray codes differ in one bit (with wrap)");

    TruthTable t3 = table_of("A AND B OR C");
    KmapLayout l3 = build_kmap(t3.variables, t3)->layout();
    ctx.check(l3.row_vars == vars("A") && l3.col_vars == vars("BC"), "3 variables: A by BC");
    ctx.check(l3.col_keys.size() == 4 && l3.col_keys[2] == std::vector<bool>{true, true},
              "columns 00 01 11 10");

    TruthTable t4 = table_of("A AND B OR C AND D");
    KmapLayout l4 = build_kmap(t4.variables, t4)->layout();
    ctx.check(l4.row_vars == vars("AB") && l4.col_vars == vars("CD"), "4 variables: AB by CD");
}

static void test_kmap_render(TestContext& ctx) {
    TruthTable t = table_of("A AND B");
    ctx.check_eq(render_kmap(*build_kmap(t.variables, t)),
                 "A\\B | 0 1\n"
                 "----+----\n"
                 "  0 | 0 0\n"
                 "  1 | 0 1\n",
                 "2-variable grid");

    TruthTable t3 = table_of("B XOR C");
    TruthTable t3a = generate_table(vars("ABC"), *parse("B XOR C"));
    ctx.check(t3.variables == vars("BC"), "B XOR C has two variables");
    ctx.check_eq(render_kmap(*build_kmap(t3a.variables, t3a)),
                 "A\\BC | 00 01 11 10\n"
                 "-----+------------\n"
                 "   0 |  0  1  0  1\n"
                 "   1 |  0  1  0  1\n",
                 "3-variable grid in gray order");
}

// ============================================================================
// Export Tests
// ============================================================================

static void test_export_formats(TestContext& ctx) {
    TruthTable t = table_of("A AND B");
    ctx.check_eq(to_csv(t), "A,B,Result\n0,0,0\n0,1,0\n1,0,0\n1,1,1\n", "CSV layout");
    ctx.check_eq(to_tsv(t), "A\tB\tResult\n0\t0\t0\n0\t1\t0\n1\t0\t0\n1\t1\t1\n", "TSV layout");
    ctx.check_eq(to_csv(table_of("FALSE")), "Result\n0\n", "zero-variable CSV");
}

static void test_export_import(TestContext& ctx) {
    for (const auto& src : kSampleFormulas) {
        TruthTable t = table_of(src);
        ctx.check(from_csv(to_csv(t)) == t, "CSV re-import: " + src);
    }
    TruthTable crlf = from_csv("A,Result\r\n0,1\r\n1,0\r\n\r\n");
    ctx.check(crlf.variables == vars("A") && results(crlf) == "10", "CRLF and blank lines");

    ctx.check_throws<std::runtime_error>([] { from_csv(""); }, "missing header");
    ctx.check_throws<std::runtime_error>([] { from_csv("A,B\n0,0\n"); }, "header without Result");
    ctx.check_throws<std::runtime_error>([] { from_csv("AB,Result\n0,0\n1,0\n"); }, "bad variable name");
    ctx.check_throws<std::runtime_error>([] { from_csv("A,A,Result\n"); }, "duplicate variable");
    ctx.check_throws<std::runtime_error>([] { from_csv("A,Result\n0,2\n1,0\n"); }, "cell not 0/1");
    ctx.check_throws<std::runtime_error>([] { from_csv("A,Result\n0\n1,0\n"); }, "short row");
    ctx.check_throws<std::runtime_error>([] { from_csv("A,Result\n0,1\n"); }, "missing rows");
    ctx.check_throws<std::runtime_error>(
        [] { from_csv("A,B,Result\n0,0,1\n0,0,1\n0,0,1\n0,0,1\n"); }, "repeated assignment");
    ctx.check_throws<std::runtime_error>(
        [] { from_csv("A,B,Result\n0,0,1\n1,0,1\n0,1,1\n1,1,1\n"); }, "rows out of order");
    ctx.check_throws<std::runtime_error>(
        [] { from_csv("A,Result\n0,1\n1,0\n0,1\n"); }, "surplus row");

    try {
        from_csv("A,B,Result\n0,0,0\n0,1,0\n0,1,0\n1,1,1\n");
        ctx.check(false, "third row 01 should throw");
    } catch (const std::runtime_error& e) {
        ctx.check(std::string(e.what()).find("line 4") != std::string::npos,
                  "order error names line 4");
    }

    try {
        from_csv("A,Result\n0,1\n1,x\n");
        ctx.check(false, "bad cell should throw");
    } catch (const std::runtime_error& e) {
        ctx.check(std::string(e.what()).find("line 3") != std::string::npos, "error names line 3");
    }
}

static void test_export_write_file(TestContext& ctx) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "truthtab_selftest.csv";
    TruthTable t = table_of("A -> B");

    write_csv(path.string(), t);
    std::string content;
    for (const auto& line : read_lines(path.string())) content += line + "\n";
    ctx.check_eq(content, to_csv(t), "file content");
    ctx.check(from_csv(content) == t, "file re-import");
    fs::remove(path);

    ctx.check_throws<std::runtime_error>(
        [&] { write_csv((fs::temp_directory_path() / "no_such_dir_truthtab" / "x.csv").string(), t); },
        "unwritable path");
}

// ============================================================================
// CLI / Utility Tests
// ============================================================================

static Options args(std::vector<std::string> words) {
    words.insert(words.begin(), "truthtab");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static void test_cli_parse_args(TestContext& ctx) {
    Options o = args({"A AND B", "--all"});
    ctx.check_eq(o.input, "A AND B", "formula argument");
    ctx.check(o.show_dnf && o.show_cnf && o.show_kmap && o.show_checks, "--all sets every view");
    ctx.check(!o.verify && !o.tsv && o.csv_path.empty(), "other flags default off");

    Options c = args({"--csv", "out.csv", "--equiv", "B OR A", "--tsv", "--verify", "f.txt"});
    ctx.check_eq(c.csv_path, "out.csv", "--csv path");
    ctx.check_eq(c.equiv_with, "B OR A", "--equiv formula");
    ctx.check(c.tsv && c.verify, "--tsv --verify");
    ctx.check_eq(c.input, "f.txt", "file argument");

    ctx.check(args({"--selftest"}).selftest, "--selftest without input");
    ctx.check(args({"-h"}).help, "-h");

    ctx.check_throws<std::runtime_error>([] { args({}); }, "no input");
    ctx.check_throws<std::runtime_error>([] { args({"A", "--csv"}); }, "--csv without path");
    ctx.check_throws<std::runtime_error>([] { args({"A", "--equiv", " "}); }, "--equiv blank");
    ctx.check_throws<std::runtime_error>([] { args({"A", "--bogus"}); }, "unknown option");
    ctx.check_throws<std::runtime_error>([] { args({"A", "B"}); }, "two inputs");
}

static void test_cli_csv_paths(TestContext& ctx) {
    ctx.check_eq(csv_path_for_line("out.csv", 3), "out_3.csv", "suffix before extension");
    ctx.check_eq(csv_path_for_line("dir/t.csv", 12), "dir/t_12.csv", "directory kept");
    ctx.check_eq(csv_path_for_line("table", 1), "table_1", "no extension");
}

static void test_cli_usage(TestContext& ctx) {
    std::ostringstream out;
    print_usage(out, "truthtab");
    const std::string text = out.str();
    ctx.check(text.starts_with("Usage: truthtab [OPTIONS]"), "usage line names the program");
    for (const char* flag : {"--dnf", "--cnf", "--kmap", "--check", "--all", "--tsv",
                             "--csv", "--verify", "--equiv", "--selftest", "--help"}) {
        ctx.check(text.find(flag) != std::string::npos, std::string("usage lists ") + flag);
    }
}

// ── Driver ──────────────────────────────────────────────────────────────────

namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

static std::string read_text(const fs::path& path) {
    std::string content;
    for (const auto& line : read_lines(path.string())) content += line + "\n";
    return content;
}

static void test_cli_run_formula_file(TestContext& ctx) {
    fs::path dir = fresh_dir("truthtab_selftest_run");
    fs::path input = dir / "formulas.txt";
    write_text(input,
               "# truth tables for the driver\n"
               "A AND B\n"
               "\n"
               "A AND (B\n"
               "A -> B   # implication\n");

    Options opts;
    opts.input = input.string();
    opts.csv_path = (dir / "out.csv").string();
    opts.show_dnf = opts.show_cnf = opts.show_kmap = opts.show_checks = true;
    opts.verify = true;
    opts.equiv_with = "NOT A OR B";

    ctx.check(run(opts) == 1, "a bad line makes the run fail");
    ctx.check(fs::exists(dir / "out_2.csv"), "line 2 written despite the later error");
    ctx.check(fs::exists(dir / "out_5.csv"), "line 5 processed after the bad line 4");
    ctx.check(!fs::exists(dir / "out_4.csv"), "no table for the bad line");
    ctx.check(!fs::exists(dir / "out_1.csv") && !fs::exists(dir / "out_3.csv"),
              "comment and blank lines are skipped");
    ctx.check_eq(read_text(dir / "out_2.csv"), to_csv(table_of("A AND B")), "line 2 table");
    ctx.check_eq(read_text(dir / "out_5.csv"), to_csv(table_of("A -> B")),
                 "inline comment stripped from line 5");

    fs::path good = dir / "good.txt";
    write_text(good, "A OR NOT A\nNAND(A, B)  # nand\nXOR(A, B) <-> NOT (A <-> B)\n");
    Options verify;
    verify.input = good.string();
    verify.verify = true;
    verify.equiv_with = "TRUE";
    ctx.check(run(verify) == 0, "--verify and --equiv succeed on valid lines");

    fs::path comments = dir / "comments.txt";
    write_text(comments, "# nothing here\n\n   # or here\n");
    Options empty;
    empty.input = comments.string();
    ctx.check(run(empty) == 1, "a file without formulas fails");

    Options missing;
    missing.input = (dir / "no_such_file.txt").string();
    ctx.check(run(missing) == 1, "missing input file fails");

    Options bad_equiv;
    bad_equiv.input = good.string();
    bad_equiv.equiv_with = "A AND";
    ctx.check(run(bad_equiv) == 1, "unparsable --equiv formula fails");

    fs::remove_all(dir);
}

static void test_cli_run_single_formula(TestContext& ctx) {
    fs::path dir = fresh_dir("truthtab_selftest_single");

    Options opts;
    opts.input = "A -> B";
    opts.csv_path = (dir / "table.csv").string();
    ctx.check(run(opts) == 0, "single formula succeeds");
    ctx.check(fs::exists(dir / "table.csv"), "single formula keeps the CSV path as given");

    Options hash;
    hash.input = "A # B";
    ctx.check(run(hash) == 1, "'#' in a command-line formula is an error");

    Options blank;
    blank.input = "   ";
    ctx.check(run(blank) == 1, "blank formula fails");

    Options bad;
    bad.input = "NAND(A)";
    ctx.check(run(bad) == 1, "parse error fails");

    fs::remove_all(dir);
}

static void test_utils(TestContext& ctx) {
    ctx.check_eq(trim("  A AND B \t\r\n"), "A AND B", "trim");
    ctx.check_eq(strip_comment("A OR B  # note"), "A OR B", "strip_comment");
    ctx.check(strip_comment("# only a comment").empty(), "comment-only line");
    auto parts = split("0,,1", ',');
    ctx.check(parts.size() == 3 && parts[1].empty(), "split keeps empty fields");
    ctx.check(split("", ',').size() == 1, "split of empty string");
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer tests
    runner.run("lexer_keywords",              test_lexer_keywords);
    runner.run("lexer_symbols",               test_lexer_symbols);
    runner.run("lexer_unknown_and_positions", test_lexer_unknown_and_positions);
    runner.run("extract_variables",           test_extract_variables);

    // Parser tests
    runner.run("parse_precedence",            test_parse_precedence);
    runner.run("parse_associativity",         test_parse_associativity);
    runner.run("parse_spellings",             test_parse_spellings);
    runner.run("parse_functions",             test_parse_functions);
    runner.run("parse_functions_nested",      test_parse_functions_nested);
    runner.run("parse_roundtrip",             test_parse_roundtrip);
    runner.run("parse_errors",                test_parse_errors);
    runner.run("parse_error_details",         test_parse_error_details);
    runner.run("parse_nesting_limit",         test_parse_nesting_limit);
    runner.run("formula_object",              test_formula_object);

    // Evaluator tests
    runner.run("evaluator_semantics",         test_evaluator_semantics);
    runner.run("evaluator_missing_variable",  test_evaluator_missing_variable);

    // Truth table tests
    runner.run("table_order",                 test_table_order);
    runner.run("table_sizes",                 test_table_sizes);
    runner.run("table_scenarios",             test_table_scenarios);
    runner.run("table_zero_variables",        test_table_zero_variables);
    runner.run("table_errors",                test_table_errors);
    runner.run("format_table",                test_format_table);

    // Canonical forms
    runner.run("dnf_cnf_literals",            test_dnf_cnf_literals);
    runner.run("dnf_cnf_constants",           test_dnf_cnf_constants);
    runner.run("dnf_cnf_reevaluate",          test_dnf_cnf_reevaluate);

    // Z3 cross-checks
    runner.run("z3_queries",                  test_z3_queries);
    runner.run("z3_agrees_with_tables",       test_z3_agrees_with_tables);

    // Karnaugh maps
    runner.run("kmap_supported",              test_kmap_supported);
    runner.run("kmap_unsupported",            test_kmap_unsupported);
    runner.run("kmap_layout",                 test_kmap_layout);
    runner.run("kmap_render",                 test_kmap_render);

    // Export
    runner.run("export_formats",              test_export_formats);
    runner.run("export_import",               test_export_import);
    runner.run("export_write_file",           test_export_write_file);

    // CLI and utilities
    runner.run("cli_parse_args",              test_cli_parse_args);
    runner.run("cli_csv_paths",               test_cli_csv_paths);
    runner.run("cli_usage",                   test_cli_usage);
    runner.run("cli_run_formula_file",        test_cli_run_formula_file);
    runner.run("cli_run_single_formula",      test_cli_run_single_formula);
    runner.run("utils",                       test_utils);

    return runner.summarise();
}

}  // namespace truthtab
