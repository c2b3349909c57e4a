// ============================================================================
// truthtab/parser.hpp — Recursive-descent parser for boolean formulas
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   formula     ::= equiv_expr
//   equiv_expr  ::= impl_expr ( ('<->' | 'EQUIV')   impl_expr )*
//   impl_expr   ::= xor_expr  ( ('->'  | 'IMPLIES') xor_expr  )*
//   xor_expr    ::= or_expr   ( ('XOR' | '^')       or_expr   )*
//   or_expr     ::= and_expr  ( ('OR'  | '|')       and_expr  )*
//   and_expr    ::= unary     ( ('AND' | '&')       unary     )*
//   unary       ::= ('NOT' | '!') unary
//                 | primary
//   primary     ::= VARIABLE | 'TRUE' | 'FALSE'
//                 | '(' formula ')'
//                 | 'NAND' '(' formula ',' formula ')'
//                 | 'NOR'  '(' formula ',' formula ')'
//                 | 'XOR'  '(' formula ',' formula ')'
//
// Precedence (highest → lowest):
//   1. NOT                   (unary prefix)
//   2. AND                   (left-assoc)
//   3. OR                    (left-assoc)
//   4. XOR                   (left-assoc)
//   5. ->                    (left-assoc)
//   6. <->                   (left-assoc)
//
// ============================================================================

#ifndef TRUTHTAB_PARSER_HPP
#define TRUTHTAB_PARSER_HPP

#include "truthtab/ast.hpp"
#include "truthtab/lexer.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace truthtab {

// ── ParseError ──────────────────────────────────────────────────────────────
// Thrown for malformed formula text.  what() has the format
//   <line>: ERROR: <message> at column <n>
// and the offending fragment and its position are kept for callers that
// want to highlight it.

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::string fragment, SourcePos pos);

    const std::string& fragment() const noexcept { return fragment_; }
    SourcePos          pos() const noexcept { return pos_; }

private:
    std::string fragment_;
    SourcePos   pos_;
};

// ── Parser ──────────────────────────────────────────────────────────────────
// Takes a Lexer and parses exactly one formula.  Operands may nest (through
// NOT, parentheses or calls) at most kMaxNestingDepth levels deep.

inline constexpr std::size_t kMaxNestingDepth = 1000;

class Parser {
public:
    explicit Parser(Lexer& lexer);

    /// Parse a complete formula (expects Eof after).
    ExprPtr parse();

    /// Parse a formula without requiring Eof — used for sub-expressions.
    ExprPtr parse_formula();

private:
    // ── Recursive-descent methods, one per precedence level ─────────────
    ExprPtr parse_equiv();
    ExprPtr parse_implies();
    ExprPtr parse_xor();
    ExprPtr parse_or();
    ExprPtr parse_and();
    ExprPtr parse_unary();
    ExprPtr parse_primary();

    // NAND(a, b), NOR(a, b), XOR(a, b) — the keyword is already consumed.
    ExprPtr parse_call(const Token& name, NodeKind kind);

    // ── Helpers ─────────────────────────────────────────────────────────
    Token expect(TokenKind kind, const std::string& context);
    [[noreturn]] void error(const Token& tok, const std::string& msg);

    Lexer&      lex_;
    std::size_t depth_ = 0;
};

// ── Convenience free function ───────────────────────────────────────────────
// Parse a single formula from a string.

ExprPtr parse(std::string_view input, std::uint32_t line = 1);

// ── Formula ─────────────────────────────────────────────────────────────────
// Immutable pairing of the input text, its variables and its parsed tree.
// Only Formula::parse() creates one, so a Formula always holds a valid tree.

class Formula {
public:
    static Formula parse(std::string_view text, std::uint32_t line = 1);

    const std::string&           text() const noexcept { return text_; }
    const std::vector<Variable>& variables() const noexcept { return vars_; }
    const Expr&                  expr() const noexcept { return *expr_; }

private:
    Formula(std::string text, std::vector<Variable> vars, ExprPtr expr);

    std::string           text_;
    std::vector<Variable> vars_;
    ExprPtr               expr_;
};

}  // namespace truthtab

#endif  // TRUTHTAB_PARSER_HPP
