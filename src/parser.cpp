// ============================================================================
// parser.cpp — Recursive-descent formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// The recursive-descent structure mirrors the grammar directly:
//
//   parse()           calls parse_equiv() and then expects Eof.
//   parse_equiv()     handles  <->  EQUIV
//   parse_implies()   handles  ->   IMPLIES
//   parse_xor()       handles  XOR  ^
//   parse_or()        handles  OR   |
//   parse_and()       handles  AND  &
//   parse_unary()     handles  NOT  !   (prefix)
//   parse_primary()   handles  variables, constants, parens, function calls.
//
// Every binary level loops, so all binary operators are left-associative:
//   A -> B -> C  =  (A -> B) -> C
//
// A keyword in operand position followed by '(' is a function call; XOR in
// operator position is the infix connective.
//
// ============================================================================

#include "truthtab/parser.hpp"

#include <utility>

namespace truthtab {

// ── ParseError ──────────────────────────────────────────────────────────────

namespace {

std::string format_error(const std::string& msg, SourcePos pos) {
    return std::to_string(pos.line) + ": ERROR: " + msg +
           " at column " + std::to_string(pos.column);
}

}  // namespace

ParseError::ParseError(const std::string& message, std::string fragment, SourcePos pos)
    : std::runtime_error(format_error(message, pos)),
      fragment_(std::move(fragment)),
      pos_(pos) {}

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(Lexer& lexer)
    : lex_(lexer) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw ParseError(msg, tok.text, tok.pos);
}

Token Parser::expect(TokenKind kind, const std::string& context) {
    Token t = lex_.next();
    if (t.kind != kind) {
        std::string got = t.kind == TokenKind::Eof ? "end of input" : "'" + t.text + "'";
        error(t, "expected '" + std::string(token_kind_name(kind)) +
                 "' " + context + ", got " + got);
    }
    return t;
}

// ── parse ───────────────────────────────────────────────────────────────────
// Entry point: parse one formula then require end-of-input.

ExprPtr Parser::parse() {
    const Token& first = lex_.peek();
    if (first.kind == TokenKind::Eof) {
        error(first, "empty formula");
    }

    ExprPtr f = parse_formula();
    const Token& t = lex_.peek();
    if (t.kind == TokenKind::RParen) {
        error(t, "unmatched ')'");
    }
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token '" + t.text + "' after formula");
    }
    return f;
}

ExprPtr Parser::parse_formula() {
    return parse_equiv();
}

// ── parse_equiv ─────────────────────────────────────────────────────────────
// equiv_expr ::= impl_expr ( ('<->' | 'EQUIV') impl_expr )*

ExprPtr Parser::parse_equiv() {
    ExprPtr lhs = parse_implies();
    while (lex_.peek().kind == TokenKind::DoubleArrow ||
           lex_.peek().kind == TokenKind::KwEquiv) {
        lex_.next();
        ExprPtr rhs = parse_implies();
        lhs = make_equiv(std::move(lhs), std::move(rhs));
    }
    return lhs;
}

// ── parse_implies ───────────────────────────────────────────────────────────
// impl_expr ::= xor_expr ( ('->' | 'IMPLIES') xor_expr )*

ExprPtr Parser::parse_implies() {
    ExprPtr lhs = parse_xor();
    while (lex_.peek().kind == TokenKind::Arrow ||
           lex_.peek().kind == TokenKind::KwImplies) {
        lex_.next();
        ExprPtr rhs = parse_xor();
        lhs = make_implies(std::move(lhs), std::move(rhs));
    }
    return lhs;
}

// ── parse_xor ───────────────────────────────────────────────────────────────

ExprPtr Parser::parse_xor() {
    ExprPtr lhs = parse_or();
    while (lex_.peek().kind == TokenKind::KwXor ||
           lex_.peek().kind == TokenKind::Caret) {
        lex_.next();
        ExprPtr rhs = parse_or();
        lhs = make_xor(std::move(lhs), std::move(rhs));
    }
    return lhs;
}

// ── parse_or ────────────────────────────────────────────────────────────────

ExprPtr Parser::parse_or() {
    ExprPtr lhs = parse_and();
    while (lex_.peek().kind == TokenKind::KwOr ||
           lex_.peek().kind == TokenKind::Pipe) {
        lex_.next();
        ExprPtr rhs = parse_and();
        lhs = make_or(std::move(lhs), std::move(rhs));
    }
    return lhs;
}

// ── parse_and ───────────────────────────────────────────────────────────────

ExprPtr Parser::parse_and() {
    ExprPtr lhs = parse_unary();
    while (lex_.peek().kind == TokenKind::KwAnd ||
           lex_.peek().kind == TokenKind::Amp) {
        lex_.next();
        ExprPtr rhs = parse_unary();
        lhs = make_and(std::move(lhs), std::move(rhs));
    }
    return lhs;
}

// ── DepthGuard ──────────────────────────────────────────────────────────────

namespace {

class DepthGuard {
public:
    explicit DepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth_;
};

}  // namespace

// ── parse_unary ─────────────────────────────────────────────────────────────
// unary ::= ('NOT' | '!') unary | primary
//
// NOT binds tighter than every binary operator, so NOT A AND B is
// (NOT A) AND B.  Every operand passes through here, so the depth counter
// covers NOT chains, parentheses and call arguments alike.

ExprPtr Parser::parse_unary() {
    if (depth_ >= kMaxNestingDepth) {
        error(lex_.peek(), "nesting too deep (more than " +
                           std::to_string(kMaxNestingDepth) + " levels)");
    }
    DepthGuard guard(depth_);

    TokenKind k = lex_.peek().kind;
    if (k == TokenKind::KwNot || k == TokenKind::Bang) {
        lex_.next();
        return make_not(parse_unary());
    }
    return parse_primary();
}

// ── parse_call ──────────────────────────────────────────────────────────────
// Arguments are full formulas, so nested parentheses, NOT and further calls
// are allowed inside them.

ExprPtr Parser::parse_call(const Token& name, NodeKind kind) {
    Token open = expect(TokenKind::LParen, "after '" + name.text + "'");

    if (lex_.peek().kind == TokenKind::RParen) {
        error(lex_.peek(), name.text + " expects exactly two arguments, got none");
    }
    ExprPtr lhs = parse_formula();

    const Token& sep = lex_.peek();
    if (sep.kind == TokenKind::RParen) {
        error(sep, name.text + " expects exactly two arguments, got one");
    }
    if (sep.kind == TokenKind::Eof) {
        error(open, "unmatched '(' in call to " + name.text);
    }
    expect(TokenKind::Comma, "between arguments of " + name.text);

    ExprPtr rhs = parse_formula();

    const Token& close = lex_.peek();
    if (close.kind == TokenKind::Comma) {
        error(close, name.text + " expects exactly two arguments, got more");
    }
    if (close.kind == TokenKind::Eof) {
        error(open, "unmatched '(' in call to " + name.text);
    }
    expect(TokenKind::RParen, "closing " + name.text + "(...)");

    return make_binary(kind, std::move(lhs), std::move(rhs));
}

// ── parse_primary ───────────────────────────────────────────────────────────
// primary ::= VARIABLE | 'TRUE' | 'FALSE'
//           | '(' formula ')'
//           | ('NAND' | 'NOR' | 'XOR') '(' formula ',' formula ')'

ExprPtr Parser::parse_primary() {
    Token t = lex_.next();

    switch (t.kind) {
        case TokenKind::Variable:
            return make_var(t.text[0]);

        case TokenKind::KwTrue:
            return make_true();

        case TokenKind::KwFalse:
            return make_false();

        case TokenKind::LParen: {
            ExprPtr inner = parse_formula();
            const Token& close = lex_.peek();
            if (close.kind == TokenKind::Eof) {
                error(t, "unmatched '('");
            }
            expect(TokenKind::RParen, "to close '('");
            return inner;
        }

        case TokenKind::KwNand:
            return parse_call(t, NodeKind::Nand);

        case TokenKind::KwNor:
            return parse_call(t, NodeKind::Nor);

        case TokenKind::KwXor:
            return parse_call(t, NodeKind::Xor);

        case TokenKind::Eof:
            error(t, "unexpected end of input, expected an operand");

        case TokenKind::RParen:
            error(t, "unexpected ')', expected an operand");

        case TokenKind::Unknown:
            error(t, "unknown token '" + t.text + "'");

        default:
            error(t, "unexpected '" + t.text + "', expected an operand");
    }
}

// ── parse (convenience) ─────────────────────────────────────────────────────

ExprPtr parse(std::string_view input, std::uint32_t line) {
    Lexer lex(input, line);
    Parser parser(lex);
    return parser.parse();
}

// ── Formula ─────────────────────────────────────────────────────────────────

Formula::Formula(std::string text, std::vector<Variable> vars, ExprPtr expr)
    : text_(std::move(text)), vars_(std::move(vars)), expr_(std::move(expr)) {}

Formula Formula::parse(std::string_view text, std::uint32_t line) {
    ExprPtr tree = truthtab::parse(text, line);
    return Formula(std::string(text), extract_variables(text), std::move(tree));
}

}  // namespace truthtab
