// ============================================================================
// truthtab/lexer.hpp — Tokeniser and normaliser for boolean formulas
// ============================================================================
//
// The lexer converts a formula string into a stream of tokens.  Every
// token carries its source position (line, column) so that error messages
// can point the user to the exact location of a problem.
//
// Input is case-normalised (uppercased) before tokenisation, so keywords
// and variables are case-insensitive.
//
// Recognised tokens:
//   Variables    a single letter A-Z standing alone as a word
//   Keywords     AND OR NOT XOR NAND NOR IMPLIES EQUIV TRUE FALSE
//   Symbols      (  )  ,  ->  <->  !  &  |  ^
//   Unknown      any other word or character (rejected by the parser)
//   EOF          end-of-input sentinel
//
// Whitespace is skipped.  The lexer never throws: unknown input becomes an
// Unknown token so the parser can report it together with its position.
//
// ============================================================================

#ifndef TRUTHTAB_LEXER_HPP
#define TRUTHTAB_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace truthtab {

// ── Variable ────────────────────────────────────────────────────────────────
// A single uppercase letter 'A'..'Z'.  Ordering is alphabetical.

using Variable = char;

// ── SourcePos ───────────────────────────────────────────────────────────────
// 1-based line and column, used for error reporting.

struct SourcePos {
    std::uint32_t line   = 1;
    std::uint32_t column = 1;
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    Variable,       // single letter A-Z

    // Constants
    KwTrue,         // TRUE
    KwFalse,        // FALSE

    // Word operators
    KwNot,          // NOT
    KwAnd,          // AND
    KwOr,           // OR
    KwXor,          // XOR  (infix, or XOR(a, b))
    KwNand,         // NAND (function form only)
    KwNor,          // NOR  (function form only)
    KwImplies,      // IMPLIES
    KwEquiv,        // EQUIV

    // Symbolic operators
    Bang,           // !
    Amp,            // &
    Pipe,           // |
    Caret,          // ^
    Arrow,          // ->
    DoubleArrow,    // <->

    // Delimiters
    LParen,         // (
    RParen,         // )
    Comma,          // ,

    Unknown,        // unrecognised word or character

    // Sentinel
    Eof
};

/// Human-readable name for debugging and error messages.
const char* token_kind_name(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Owns a normalised copy of the input and lazily produces tokens via next().

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source  the full text to tokenise (normalised internally)
    /// @param line    the starting line number (default 1)
    explicit Lexer(std::string_view source, std::uint32_t line = 1);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

    /// Current source position (of the next character to be read).
    SourcePos current_pos() const noexcept;

private:
    void  skip_whitespace();
    Token read_word();
    Token make_token(TokenKind kind, std::string text, SourcePos pos);

    std::string src_;
    std::size_t idx_ = 0;
    SourcePos   pos_;
    bool        has_peeked_ = false;
    Token       peeked_;
};

// ── normalize ───────────────────────────────────────────────────────────────
// Uppercase a formula.  Both the lexer and extract_variables() work on the
// normalised text.

std::string normalize(std::string_view text);

// ── extract_variables ───────────────────────────────────────────────────────
// Sorted, de-duplicated set of single-letter words in `text`.  A word is a
// maximal run of letters, digits and '_', so letters inside keywords such
// as AND or NOR are not variables.  Never fails.

std::vector<Variable> extract_variables(std::string_view text);

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source, std::uint32_t line = 1);

}  // namespace truthtab

#endif  // TRUTHTAB_LEXER_HPP
